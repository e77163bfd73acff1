#ifndef CINEMA_ENGINE_CONFIG_HPP_
#define CINEMA_ENGINE_CONFIG_HPP_

#include "cinema_engine.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace cinema {

/**
 * Reads a CinemaEngine::Config from a JSON file. Keys that are absent keep
 * their defaults.
 *
 * Throws BookingError(INVALID_INPUT) for an unreadable file, malformed JSON,
 * a value of the wrong type or an unknown backend / log level.
 */
CinemaEngine::Config loadEngineConfig(const std::string& path);

// Same rules, applied to an already parsed document.
CinemaEngine::Config parseEngineConfig(const nlohmann::json& document);

}  // namespace cinema

#endif  // CINEMA_ENGINE_CONFIG_HPP_
