#pragma once

// Boost 1.86 moved the classic Boost.Process API under boost::process::v1.

#include <boost/version.hpp>

#if BOOST_VERSION >= 108600
#include <boost/process/v1.hpp>
#include <boost/process/v1/extend.hpp>

namespace codebox::sandbox {
namespace bp = boost::process::v1;
}  // namespace codebox::sandbox
#else
#include <boost/process.hpp>
#include <boost/process/extend.hpp>

namespace codebox::sandbox {
namespace bp = boost::process;
}  // namespace codebox::sandbox
#endif
