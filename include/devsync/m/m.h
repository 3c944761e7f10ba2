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
#define HAVE_DEVSYNC_M_H

/// Matrix Protocol System
namespace devsync::m
{
	extern struct log::log log;
}

#include "error.h"
#include "id.h"
#include "device.h"
#include "store.h"
#include "state.h"
#include "notifier.h"
#include "fed.h"
#include "device_list/device_list.h"
#include "devices.h"
