#include "redraw_decoder.hpp"
#include <cmath>
#include <functional>
#include <limits>
#include <sstream>
#include <type_traits>
#include <unordered_map>
#include <spdlog/spdlog.h>
#include "config.hpp"

namespace {

using Args = msgpack::object_array;
using Out = std::vector<Notification>;
using Handler = std::function<bool(const Args&, Out&, std::string&)>;

std::string show(const msgpack::object& o) {
  std::ostringstream oss;
  oss << o;
  return oss.str();
}

bool is_string(const msgpack::object& o) { return o.type == msgpack::type::STR; }

std::string str_of(const msgpack::object& o) { return std::string(o.via.str.ptr, o.via.str.size); }

bool as_int64(const msgpack::object& o, std::int64_t& out) {
  if (o.type == msgpack::type::POSITIVE_INTEGER) {
    if (o.via.u64 > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) return false;
    out = static_cast<std::int64_t>(o.via.u64);
    return true;
  }
  if (o.type == msgpack::type::NEGATIVE_INTEGER) {
    out = o.via.i64;
    return true;
  }
  return false;
}

bool fits_int(std::int64_t v) {
  return v >= std::numeric_limits<int>::min() && v <= std::numeric_limits<int>::max();
}

// map entry lookup by string key; nullptr when absent or o is not a map
const msgpack::object* find_key(const msgpack::object& o, std::string_view key) {
  if (o.type != msgpack::type::MAP) return nullptr;
  for (uint32_t i = 0; i < o.via.map.size; ++i) {
    const msgpack::object_kv& kv = o.via.map.ptr[i];
    if (is_string(kv.key) && std::string_view(kv.key.via.str.ptr, kv.key.via.str.size) == key) return &kv.val;
  }
  return nullptr;
}

bool need(const Args& a, size_t n, std::string& msg) {
  if (a.size >= n) return true;
  msg = "expected " + std::to_string(n) + " arguments, got " + std::to_string(a.size);
  return false;
}

bool get_int(const Args& a, size_t i, std::int64_t& out, std::string& msg) {
  if (as_int64(a.ptr[i], out)) return true;
  msg = "argument " + std::to_string(i) + " is not an integer: " + show(a.ptr[i]);
  return false;
}

bool get_int(const Args& a, size_t i, int& out, std::string& msg) {
  std::int64_t v = 0;
  if (!get_int(a, i, v, msg)) return false;
  if (!fits_int(v)) {
    msg = "argument " + std::to_string(i) + " is out of range: " + std::to_string(v);
    return false;
  }
  out = static_cast<int>(v);
  return true;
}

// float anchors arrive as doubles; the fraction is dropped
bool get_number(const Args& a, size_t i, int& out, std::string& msg) {
  const msgpack::object& o = a.ptr[i];
  if (o.type != msgpack::type::FLOAT32 && o.type != msgpack::type::FLOAT64) return get_int(a, i, out, msg);
  double d = o.via.f64;
  if (!std::isfinite(d) || d < std::numeric_limits<int>::min() || d > std::numeric_limits<int>::max()) {
    msg = "argument " + std::to_string(i) + " is out of range: " + show(o);
    return false;
  }
  out = static_cast<int>(d);
  return true;
}

bool get_bool(const Args& a, size_t i, bool& out, std::string& msg) {
  if (a.ptr[i].type == msgpack::type::BOOLEAN) { out = a.ptr[i].via.boolean; return true; }
  msg = "argument " + std::to_string(i) + " is not a boolean: " + show(a.ptr[i]);
  return false;
}

bool get_string(const Args& a, size_t i, std::string& out, std::string& msg) {
  if (is_string(a.ptr[i])) { out = str_of(a.ptr[i]); return true; }
  msg = "argument " + std::to_string(i) + " is not a string: " + show(a.ptr[i]);
  return false;
}

bool get_array(const Args& a, size_t i, const Args*& out, std::string& msg) {
  if (a.ptr[i].type == msgpack::type::ARRAY) { out = &a.ptr[i].via.array; return true; }
  msg = "argument " + std::to_string(i) + " is not an array: " + show(a.ptr[i]);
  return false;
}

// window/buffer handles are ints or ext values; the engine does not use them
bool check_handle(const Args& a, size_t i, std::string& msg) {
  std::int64_t ignored = 0;
  if (as_int64(a.ptr[i], ignored) || a.ptr[i].type == msgpack::type::EXT) return true;
  msg = "argument " + std::to_string(i) + " is not a handle: " + show(a.ptr[i]);
  return false;
}

bool color_or_unset(std::int64_t v, std::optional<Rgb>& out, std::string& msg) {
  if (v > 0xFFFFFF) { msg = "color out of range: " + std::to_string(v); return false; }
  out = v < 0 ? std::nullopt : std::optional<Rgb>(static_cast<Rgb>(v));
  return true;
}

bool read_hl_attr(const msgpack::object& m, HlAttr& attr, std::string& msg) {
  if (m.type != msgpack::type::MAP) { msg = "rgb_attrs is not a map"; return false; }
  for (uint32_t i = 0; i < m.via.map.size; ++i) {
    const msgpack::object& k = m.via.map.ptr[i].key;
    const msgpack::object& v = m.via.map.ptr[i].val;
    if (!is_string(k)) continue;
    std::string key = str_of(k);
    if (key == "foreground" || key == "background" || key == "special") {
      std::int64_t c = 0;
      if (!as_int64(v, c)) { msg = key + " is not an integer"; return false; }
      std::optional<Rgb> rgb;
      if (!color_or_unset(c, rgb, msg)) return false;
      if (key == "foreground") attr.foreground = rgb;
      else if (key == "background") attr.background = rgb;
      else attr.special = rgb;
    } else if (key == "blend") {
      std::int64_t b = 0;
      if (!as_int64(v, b) || b < 0 || b > 100) { msg = "bad blend " + show(v); return false; }
      attr.blend = static_cast<int>(b);
    } else {
      bool on = v.type == msgpack::type::BOOLEAN ? v.via.boolean : true;
      if (key == "bold") attr.bold = on;
      else if (key == "italic") attr.italic = on;
      else if (key == "underline") attr.underline = on;
      else if (key == "undercurl") attr.undercurl = on;
      else if (key == "underdouble") attr.underdouble = on;
      else if (key == "underdotted") attr.underdotted = on;
      else if (key == "underdashed") attr.underdashed = on;
      else if (key == "strikethrough") attr.strikethrough = on;
      else if (key == "reverse") attr.reverse = on;
      else if (key == "standout") attr.standout = on;
    }
  }
  return true;
}

bool read_mode_info(const msgpack::object& m, ModeInfo& mi, std::string& msg) {
  if (m.type != msgpack::type::MAP) { msg = "mode info is not a map"; return false; }
  auto str = [&](const char* key, std::string& dst) {
    if (const msgpack::object* v = find_key(m, key); v && is_string(*v)) dst = str_of(*v);
  };
  // non-integers are ignored, integers must fit
  auto num = [&](const char* key, auto& dst) {
    const msgpack::object* v = find_key(m, key);
    std::int64_t i = 0;
    if (!v || !as_int64(*v, i)) return true;
    if (!fits_int(i)) { msg = std::string(key) + " is out of range: " + std::to_string(i); return false; }
    dst = static_cast<std::remove_reference_t<decltype(dst)>>(i);
    return true;
  };
  std::string shape;
  str("cursor_shape", shape);
  mi.shape = parse_cursor_shape(shape);
  str("name", mi.name);
  str("short_name", mi.short_name);
  return num("cell_percentage", mi.cell_percentage) && num("blinkwait", mi.blinkwait) &&
         num("blinkon", mi.blinkon) && num("blinkoff", mi.blinkoff) && num("attr_id", mi.attr_id);
}

bool read_grid_cells(const Args& raw, std::vector<GridLineCell>& cells, std::string& msg) {
  cells.reserve(raw.size);
  for (uint32_t i = 0; i < raw.size; ++i) {
    const msgpack::object& c = raw.ptr[i];
    if (c.type != msgpack::type::ARRAY || c.via.array.size == 0 || c.via.array.size > 3) {
      msg = "bad cell " + show(c);
      return false;
    }
    const Args& parts = c.via.array;
    GridLineCell cell;
    if (!get_string(parts, 0, cell.text, msg)) return false;
    if (parts.size > 1) {
      std::int64_t hl = 0;
      if (!get_int(parts, 1, hl, msg)) return false;
      cell.hl = hl;
    }
    if (parts.size > 2 && !get_int(parts, 2, cell.repeat, msg)) return false;
    if (cell.repeat < 0) { msg = "negative repeat"; return false; }
    cells.push_back(std::move(cell));
  }
  return true;
}

bool read_popup_items(const Args& raw, std::vector<PopupMenuItem>& items, std::string& msg) {
  for (uint32_t i = 0; i < raw.size; ++i) {
    const msgpack::object& it = raw.ptr[i];
    if (it.type != msgpack::type::ARRAY || it.via.array.size < 4) {
      msg = "bad popupmenu item " + show(it);
      return false;
    }
    const Args& f = it.via.array;
    PopupMenuItem item;
    if (!get_string(f, 0, item.word, msg) || !get_string(f, 1, item.kind, msg) ||
        !get_string(f, 2, item.menu, msg) || !get_string(f, 3, item.info, msg))
      return false;
    items.push_back(std::move(item));
  }
  return true;
}

std::optional<int> selection(int idx) {
  if (idx < 0) return std::nullopt;
  return idx;
}

bool parse_anchor(const std::string& s, Anchor& a) {
  if (s == "NW") a = Anchor::NW;
  else if (s == "NE") a = Anchor::NE;
  else if (s == "SW") a = Anchor::SW;
  else if (s == "SE") a = Anchor::SE;
  else return false;
  return true;
}

const std::unordered_map<std::string_view, Handler>& handlers() {
  static const std::unordered_map<std::string_view, Handler> table = {
    {"grid_resize", [](const Args& a, Out& out, std::string& msg) {
      GridResizeEvent e;
      if (!need(a, 3, msg) || !get_int(a, 0, e.grid, msg) || !get_int(a, 1, e.width, msg) ||
          !get_int(a, 2, e.height, msg))
        return false;
      out.emplace_back(std::move(e));
      return true;
    }},
    {"grid_line", [](const Args& a, Out& out, std::string& msg) {
      GridLineEvent e;
      const Args* cells = nullptr;
      if (!need(a, 4, msg) || !get_int(a, 0, e.grid, msg) || !get_int(a, 1, e.row, msg) ||
          !get_int(a, 2, e.col_start, msg) || !get_array(a, 3, cells, msg) ||
          !read_grid_cells(*cells, e.cells, msg))
        return false;
      out.emplace_back(std::move(e));
      return true;
    }},
    {"grid_clear", [](const Args& a, Out& out, std::string& msg) {
      GridClearEvent e;
      if (!need(a, 1, msg) || !get_int(a, 0, e.grid, msg)) return false;
      out.emplace_back(e);
      return true;
    }},
    {"grid_destroy", [](const Args& a, Out& out, std::string& msg) {
      GridDestroyEvent e;
      if (!need(a, 1, msg) || !get_int(a, 0, e.grid, msg)) return false;
      out.emplace_back(e);
      return true;
    }},
    {"grid_cursor_goto", [](const Args& a, Out& out, std::string& msg) {
      GridCursorGotoEvent e;
      if (!need(a, 3, msg) || !get_int(a, 0, e.grid, msg) || !get_int(a, 1, e.row, msg) ||
          !get_int(a, 2, e.col, msg))
        return false;
      out.emplace_back(e);
      return true;
    }},
    {"grid_scroll", [](const Args& a, Out& out, std::string& msg) {
      GridScrollEvent e;
      ScrollRegion& r = e.region;
      // trailing cols argument is always 0 and ignored
      if (!need(a, 6, msg) || !get_int(a, 0, e.grid, msg) || !get_int(a, 1, r.top, msg) ||
          !get_int(a, 2, r.bottom, msg) || !get_int(a, 3, r.left, msg) || !get_int(a, 4, r.right, msg) ||
          !get_int(a, 5, e.rows, msg))
        return false;
      out.emplace_back(e);
      return true;
    }},
    {"hl_attr_define", [](const Args& a, Out& out, std::string& msg) {
      HlAttrDefineEvent e;
      if (!need(a, 2, msg) || !get_int(a, 0, e.id, msg) || !read_hl_attr(a.ptr[1], e.attr, msg)) return false;
      if (a.size > 3) {
        const Args* info = nullptr;
        if (!get_array(a, 3, info, msg)) return false;
        for (uint32_t i = 0; i < info->size; ++i) {
          const msgpack::object& item = info->ptr[i];
          HlInfoItem hi;
          if (const msgpack::object* v = find_key(item, "kind"); v && is_string(*v)) hi.kind = str_of(*v);
          if (const msgpack::object* v = find_key(item, "hi_name"); v && is_string(*v)) hi.hi_name = str_of(*v);
          if (const msgpack::object* v = find_key(item, "ui_name"); v && is_string(*v)) hi.ui_name = str_of(*v);
          e.info.push_back(std::move(hi));
        }
      }
      out.emplace_back(std::move(e));
      return true;
    }},
    {"hl_group_set", [](const Args& a, Out& out, std::string& msg) {
      HlGroupSetEvent e;
      if (!need(a, 2, msg) || !get_string(a, 0, e.name, msg) || !get_int(a, 1, e.id, msg)) return false;
      out.emplace_back(std::move(e));
      return true;
    }},
    {"default_colors_set", [](const Args& a, Out& out, std::string& msg) {
      std::int64_t fg = -1, bg = -1, sp = -1;
      DefaultColorsSetEvent e;
      std::optional<Rgb> special;
      if (!need(a, 3, msg) || !get_int(a, 0, fg, msg) || !get_int(a, 1, bg, msg) || !get_int(a, 2, sp, msg) ||
          !color_or_unset(fg, e.fg, msg) || !color_or_unset(bg, e.bg, msg) || !color_or_unset(sp, special, msg))
        return false;
      out.emplace_back(e);
      return true;
    }},
    {"mode_info_set", [](const Args& a, Out& out, std::string& msg) {
      ModeInfoSetEvent e;
      const Args* infos = nullptr;
      if (!need(a, 2, msg) || !get_bool(a, 0, e.cursor_style_enabled, msg) || !get_array(a, 1, infos, msg))
        return false;
      for (uint32_t i = 0; i < infos->size; ++i) {
        ModeInfo mi;
        if (!read_mode_info(infos->ptr[i], mi, msg)) return false;
        e.infos.push_back(std::move(mi));
      }
      out.emplace_back(std::move(e));
      return true;
    }},
    {"mode_change", [](const Args& a, Out& out, std::string& msg) {
      ModeChangeEvent e;
      if (!need(a, 2, msg) || !get_string(a, 0, e.name, msg) || !get_int(a, 1, e.index, msg)) return false;
      out.emplace_back(std::move(e));
      return true;
    }},
    {"win_pos", [](const Args& a, Out& out, std::string& msg) {
      WinPosEvent e;
      if (!need(a, 6, msg) || !get_int(a, 0, e.grid, msg) || !check_handle(a, 1, msg) ||
          !get_int(a, 2, e.row, msg) || !get_int(a, 3, e.col, msg) || !get_int(a, 4, e.width, msg) ||
          !get_int(a, 5, e.height, msg))
        return false;
      out.emplace_back(e);
      return true;
    }},
    {"win_float_pos", [](const Args& a, Out& out, std::string& msg) {
      WinFloatPosEvent e;
      std::string anchor;
      if (!need(a, 6, msg) || !get_int(a, 0, e.grid, msg) || !check_handle(a, 1, msg) ||
          !get_string(a, 2, anchor, msg) || !get_int(a, 3, e.anchor_grid, msg) ||
          !get_number(a, 4, e.anchor_row, msg) || !get_number(a, 5, e.anchor_col, msg))
        return false;
      if (!parse_anchor(anchor, e.anchor)) { msg = "bad anchor " + anchor; return false; }
      e.z_index = NVGRID_FLOAT_ZINDEX;
      if (a.size > 7 && !get_int(a, 7, e.z_index, msg)) return false;
      out.emplace_back(e);
      return true;
    }},
    {"win_hide", [](const Args& a, Out& out, std::string& msg) {
      WinHideEvent e;
      if (!need(a, 1, msg) || !get_int(a, 0, e.grid, msg)) return false;
      out.emplace_back(e);
      return true;
    }},
    {"win_close", [](const Args& a, Out& out, std::string& msg) {
      WinCloseEvent e;
      if (!need(a, 1, msg) || !get_int(a, 0, e.grid, msg)) return false;
      out.emplace_back(e);
      return true;
    }},
    {"msg_set_pos", [](const Args& a, Out& out, std::string& msg) {
      MsgSetPosEvent e;
      if (!need(a, 3, msg) || !get_int(a, 0, e.grid, msg) || !get_int(a, 1, e.row, msg) ||
          !get_bool(a, 2, e.scrolled, msg))
        return false;
      out.emplace_back(e);
      return true;
    }},
    {"busy_start", [](const Args&, Out& out, std::string&) { out.emplace_back(BusyEvent{true}); return true; }},
    {"busy_stop", [](const Args&, Out& out, std::string&) { out.emplace_back(BusyEvent{false}); return true; }},
    {"mouse_on", [](const Args&, Out& out, std::string&) { out.emplace_back(MouseEnabledEvent{true}); return true; }},
    {"mouse_off", [](const Args&, Out& out, std::string&) { out.emplace_back(MouseEnabledEvent{false}); return true; }},
    {"option_set", [](const Args& a, Out& out, std::string& msg) {
      OptionSetEvent e;
      if (!need(a, 2, msg) || !get_string(a, 0, e.name, msg)) return false;
      e.value = is_string(a.ptr[1]) ? str_of(a.ptr[1]) : show(a.ptr[1]);
      out.emplace_back(std::move(e));
      return true;
    }},
    {"set_title", [](const Args& a, Out& out, std::string& msg) {
      SetTitleEvent e;
      if (!need(a, 1, msg) || !get_string(a, 0, e.title, msg)) return false;
      out.emplace_back(std::move(e));
      return true;
    }},
    {"popupmenu_show", [](const Args& a, Out& out, std::string& msg) {
      PopupMenuShowEvent e;
      const Args* items = nullptr;
      int selected = -1;
      if (!need(a, 4, msg) || !get_array(a, 0, items, msg) || !read_popup_items(*items, e.items, msg) ||
          !get_int(a, 1, selected, msg) || !get_int(a, 2, e.row, msg) || !get_int(a, 3, e.col, msg))
        return false;
      if (a.size > 4 && !get_int(a, 4, e.grid, msg)) return false;
      e.selected = selection(selected);
      out.emplace_back(std::move(e));
      return true;
    }},
    {"popupmenu_select", [](const Args& a, Out& out, std::string& msg) {
      int selected = -1;
      if (!need(a, 1, msg) || !get_int(a, 0, selected, msg)) return false;
      out.emplace_back(PopupMenuSelectEvent{selection(selected)});
      return true;
    }},
    {"popupmenu_hide", [](const Args&, Out& out, std::string&) { out.emplace_back(PopupMenuHideEvent{}); return true; }},
    {"flush", [](const Args&, Out& out, std::string&) { out.emplace_back(FlushEvent{}); return true; }},
  };
  return table;
}

}  // namespace

bool decode_event(std::string_view name, const msgpack::object_array& args, std::vector<Notification>& out,
                  std::string& msg) {
  auto it = handlers().find(name);
  if (it == handlers().end()) {
    spdlog::debug("redraw: skipping unknown event {}", name);
    return true;
  }
  std::string why;
  if (!it->second(args, out, why)) {
    msg = std::string(name) + ": " + why;
    return false;
  }
  return true;
}

bool decode_redraw(const msgpack::object& params, std::vector<Notification>& out, std::string& msg) {
  if (params.type != msgpack::type::ARRAY) { msg = "redraw: params is not an array"; return false; }
  const Args& events = params.via.array;
  std::vector<Notification> decoded;
  for (uint32_t e = 0; e < events.size; ++e) {
    const msgpack::object& ev = events.ptr[e];
    if (ev.type != msgpack::type::ARRAY || ev.via.array.size == 0 || !is_string(ev.via.array.ptr[0])) {
      msg = "redraw: bad event " + show(ev);
      return false;
    }
    const Args& group = ev.via.array;
    std::string_view name(group.ptr[0].via.str.ptr, group.ptr[0].via.str.size);
    for (uint32_t i = 1; i < group.size; ++i) {
      if (group.ptr[i].type != msgpack::type::ARRAY) {
        msg = std::string(name) + ": argument tuple is not an array";
        return false;
      }
      if (!decode_event(name, group.ptr[i].via.array, decoded, msg)) return false;
    }
  }
  for (auto& n : decoded) out.push_back(std::move(n));
  return true;
}
