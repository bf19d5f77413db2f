// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/Result.hpp"
#include "utils/ScopeGuard.hpp"

#include <QtCore/QtGlobal>

// Early-return helpers shared by the libraries. Keep this list short.

#ifndef UTILS_GUARD
#	define UTILS_GUARD(cond) do { if (!(cond)) return; } while (false)
#endif

#ifndef UTILS_GUARD_RET
#	define UTILS_GUARD_RET(cond, ret) do { if (!(cond)) return (ret); } while (false)
#endif

// For functions returning Utils::Result.
#ifndef UTILS_GUARD_OK
#	define UTILS_GUARD_OK(cond, msg) do { if (!(cond)) return ::Utils::Result::failure((msg)); } while (false)
#endif

#define UTILS__JOIN2(a, b) a##b
#define UTILS__JOIN(a, b) UTILS__JOIN2(a, b)

#ifndef UTILS_DEFER
#	define UTILS_DEFER(...) \
		auto UTILS__JOIN(_utils_defer_, __COUNTER__) = ::Utils::makeScopeGuard([&] { __VA_ARGS__; })
#endif
