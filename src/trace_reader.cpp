#include "trace_reader.hpp"
#include <cstdint>
#include <vector>

bool json_to_msgpack(const nlohmann::json& j, msgpack::object_handle& out, std::string& msg) {
  std::vector<std::uint8_t> bytes = nlohmann::json::to_msgpack(j);
  try {
    out = msgpack::unpack(reinterpret_cast<const char*>(bytes.data()), bytes.size());
  } catch (const std::exception& e) {
    msg = e.what();
    return false;
  }
  return true;
}

bool parse_trace_line(const std::string& line, TraceEntry& out, std::string& msg) {
  using nlohmann::json;

  json j;
  try {
    j = json::parse(line);
  } catch (const std::exception& e) {
    msg = e.what();
    return false;
  }
  if (!j.is_array() || j.size() != 2 || !j[0].is_string()) {
    msg = "expected [method, params]";
    return false;
  }
  out.method = j[0].get<std::string>();
  return json_to_msgpack(j[1], out.params, msg);
}
