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
#define HAVE_DEVSYNC_H

#include "stdinc.h"

// Third-party headers used throughout the interface.
#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>

/// \brief Device list synchronization core. This is the principal namespace.
///
/// The core library (this header) carries the ambient facilities: exceptions,
/// formatting, logging, configuration, json and concurrency. The matrix
/// protocol lives in devsync::m (see <devsync/matrix.h>).
///
namespace devsync
{
	extern const char *const version;
}

#include "util.h"
#include "exception.h"
#include "fmt.h"
#include "lex_cast.h"
#include "logger.h"
#include "json.h"
#include "conf.h"
#include "rand.h"
#include "http.h"
#include "ctx.h"
