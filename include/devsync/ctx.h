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
#define HAVE_DEVSYNC_CTX_H

/// Concurrency primitives. Work runs on ordinary threads; everything here
/// may be used from any of them.
namespace devsync::ctx
{
	extern log::log log;
}

#include "ctx/linearizer.h"
#include "ctx/pool.h"
