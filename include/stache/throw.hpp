#ifndef INCLUDE_STACHE_THROW_HPP_
#define INCLUDE_STACHE_THROW_HPP_

#if (defined(__cpp_exceptions) || defined(__EXCEPTIONS) || defined(_CPPUNWIND)) && !defined(STACHE_NOEXCEPTION)
#ifndef STACHE_THROW
#define STACHE_THROW(exception) throw exception
#endif
#else
#include <cstdlib>
#include <tuple>
#ifndef STACHE_THROW
#define STACHE_THROW(exception)                                                                                                                                \
  std::abort();                                                                                                                                                \
  std::ignore = exception
#endif
#ifndef STACHE_NOEXCEPTION
#define STACHE_NOEXCEPTION
#endif
#endif

#endif // INCLUDE_STACHE_THROW_HPP_
