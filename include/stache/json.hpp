#ifndef INCLUDE_STACHE_JSON_HPP_
#define INCLUDE_STACHE_JSON_HPP_

#include <nlohmann/json.hpp>

namespace stache {
#ifndef STACHE_DATA_TYPE
using json = nlohmann::json;
#else
using json = STACHE_DATA_TYPE;
#endif
} // namespace stache

#endif // INCLUDE_STACHE_JSON_HPP_
