// Matrix Construct
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2018 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

#pragma once
#define HAVE_DEVSYNC_MATRIX_H

///
/// Device list synchronization for the Matrix protocol
///

// devsync.h is included here so that it can be compiled into this header.
// Then this becomes the single leading precompiled header.
#include <devsync/devsync.h>
#include <devsync/m/m.h>
