#pragma once

#include <kprint/config.hpp>
#include <kprint/core/debug_echo.hpp>
#include <kprint/core/dispatch.hpp>
#include <kprint/core/pretty.hpp>
#include <kprint/core/sink.hpp>

#if KPRINT_STD_NAMES
using kprint::print;
using kprint::println;

#ifndef dbg
#define dbg(...) KPRINT_DBG(__VA_ARGS__)
#endif
#endif
