#ifndef INCLUDE_STACHE_STACHE_HPP_
#define INCLUDE_STACHE_STACHE_HPP_

#include "json.hpp"
#include "throw.hpp"
#include "exceptions.hpp"
#include "config.hpp"
#include "value.hpp"
#include "node.hpp"
#include "template.hpp"
#include "lexer.hpp"
#include "parser.hpp"
#include "resolver.hpp"
#include "renderer.hpp"
#include "environment.hpp"

#endif // INCLUDE_STACHE_STACHE_HPP_
