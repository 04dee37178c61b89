#pragma once
/*
 * TraceReader
 *
 * Purpose: turn one line of a recorded session trace into the method name
 *          and params object the transport would have handed up.
 * Format: one JSON array per line, ["method", params]. Params are converted
 *         to a msgpack object so they take the same decode path as the wire.
 * Usage: parse_trace_line(line, entry, msg); returns false with msg on failure.
 */
#include <string>
#include <msgpack.hpp>
#include <nlohmann/json.hpp>

struct TraceEntry {
  std::string method;
  msgpack::object_handle params;
};

bool parse_trace_line(const std::string& line, TraceEntry& out, std::string& msg);

// integers stay integers (signed or unsigned), floats stay floats
bool json_to_msgpack(const nlohmann::json& j, msgpack::object_handle& out, std::string& msg);
