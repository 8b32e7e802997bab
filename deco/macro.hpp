/*
 * macro.hpp
 *
 * Copyright (C) The deco authors
 */

/*************************************************

Description: Common source-location macros for deco

**************************************************/

#ifndef DECO_MACRO_HPP
#define DECO_MACRO_HPP

#define DECO_FILE_NAME __FILE__
#define DECO_FILE_LINE __LINE__

#if defined(__GNUC__) || defined(__clang__)
#define DECO_FUNC_NAME __PRETTY_FUNCTION__
#elif defined(_MSC_VER)
#define DECO_FUNC_NAME __FUNCSIG__
#else
#define DECO_FUNC_NAME __func__
#endif

#endif  // DECO_MACRO_HPP
