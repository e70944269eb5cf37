/*
 * sandterm C++ - JSON alias
 *
 * Event frames and the config file are nlohmann::json documents.
 */
#ifndef sandterm_CORE_JSON_HPP
#define sandterm_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace sandterm {

typedef nlohmann::json Json;

} // namespace sandterm

#endif // sandterm_CORE_JSON_HPP
