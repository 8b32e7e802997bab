/*!
 * \file deco.hpp
 * \brief Umbrella header for the call-wrapper combinators
 * \copyright Copyright (C) The deco authors
 */

#ifndef DECO_DECO_HPP
#define DECO_DECO_HPP

#include "deco/async/completion.hpp"
#include "deco/async/pool.hpp"
#include "deco/error/caught.hpp"
#include "deco/error/exception.hpp"
#include "deco/log/diagnostic.hpp"
#include "deco/meta/kwargs.hpp"
#include "deco/type/expected.hpp"
#include "deco/wrap/decorator.hpp"
#include "deco/wrap/guard.hpp"
#include "deco/wrap/repeat.hpp"
#include "deco/wrap/timing.hpp"
#include "deco/wrap/wrapper.hpp"

#endif  // DECO_DECO_HPP
