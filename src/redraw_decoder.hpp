#pragma once
/*
 * RedrawDecoder
 *
 * Purpose: turn the params of a `redraw` notification into typed
 *          Notifications, in order.
 * Shape: params = [[name, args...], [name, args...], ...]; one event name may
 *        carry several argument tuples.
 * Failure: wrong argument count/type, or an integer that does not fit the
 *          engine's coordinates, returns false with a message naming the
 *          event; nothing is appended for the batch in that case.
 *          Unknown event names are skipped.
 */
#include <string>
#include <string_view>
#include <vector>
#include <msgpack.hpp>
#include "notification.hpp"

bool decode_redraw(const msgpack::object& params, std::vector<Notification>& out, std::string& msg);

// one event tuple, e.g. decode_event("grid_resize", [1, 80, 24], ...)
bool decode_event(std::string_view name, const msgpack::object_array& args, std::vector<Notification>& out,
                  std::string& msg);
