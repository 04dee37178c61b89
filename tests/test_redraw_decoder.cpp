#include "redraw_decoder.hpp"
#include "trace_reader.hpp"
#include <cassert>
#include <cmath>
#include <string>

static msgpack::object_handle read(const std::string& s) {
  msgpack::object_handle oh;
  std::string msg;
  bool ok = json_to_msgpack(nlohmann::json::parse(s), oh, msg);
  assert(ok);
  return oh;
}

static std::vector<Notification> decode(const std::string& s) {
  std::vector<Notification> out;
  std::string msg;
  bool ok = decode_redraw(read(s).get(), out, msg);
  assert(ok);
  return out;
}

static std::string decode_fail(const std::string& s) {
  std::vector<Notification> out;
  std::string msg;
  bool ok = decode_redraw(read(s).get(), out, msg);
  assert(!ok);
  assert(out.empty());
  return msg;
}

int main() {
  // several argument tuples under one event name
  auto ev = decode("[[\"grid_resize\", [1, 80, 24], [2, 10, 3]], [\"flush\", []]]");
  assert(ev.size() == 3);
  auto& r0 = std::get<GridResizeEvent>(ev[0]);
  assert(r0.grid == 1 && r0.width == 80 && r0.height == 24);
  assert(std::get<GridResizeEvent>(ev[1]).grid == 2);
  assert(std::holds_alternative<FlushEvent>(ev[2]));

  ev = decode("[[\"grid_line\", [1, 2, 3, [[\"a\", 5], [\"b\"], [\" \", 0, 4], [\"\"]]]]]");
  auto& gl = std::get<GridLineEvent>(ev[0]);
  assert(gl.row == 2 && gl.col_start == 3);
  assert(gl.cells.size() == 4);
  assert(gl.cells[0].text == "a" && gl.cells[0].hl == 5);
  assert(!gl.cells[1].hl);
  assert(gl.cells[2].repeat == 4);
  assert(gl.cells[3].text.empty());

  ev = decode("[[\"grid_scroll\", [1, 0, 10, 0, 80, 2, 0]], [\"grid_cursor_goto\", [1, 4, 5]]]");
  auto& sc = std::get<GridScrollEvent>(ev[0]);
  assert(sc.region == (ScrollRegion{0, 10, 0, 80}) && sc.rows == 2);
  assert(std::get<GridCursorGotoEvent>(ev[1]).col == 5);

  ev = decode("[[\"hl_attr_define\", [3, {\"foreground\": 16711680, \"reverse\": true, \"blend\": 20}, {}, "
              "[{\"kind\": \"ui\", \"hi_name\": \"Visual\", \"ui_name\": \"Visual\"}]]]]");
  auto& hd = std::get<HlAttrDefineEvent>(ev[0]);
  assert(hd.id == 3 && hd.attr.foreground == 0xff0000u && hd.attr.reverse && hd.attr.blend == 20);
  assert(!hd.attr.background);
  assert(hd.info.size() == 1 && hd.info[0].hi_name == "Visual");

  ev = decode("[[\"default_colors_set\", [-1, 0, -1, 0, 0]], [\"hl_group_set\", [\"Cursor\", 3]]]");
  auto& dc = std::get<DefaultColorsSetEvent>(ev[0]);
  assert(!dc.fg && dc.bg == 0u);
  assert(std::get<HlGroupSetEvent>(ev[1]).name == "Cursor");

  ev = decode("[[\"mode_info_set\", [true, [{\"name\": \"normal\", \"cursor_shape\": \"block\", \"blinkon\": 0}, "
              "{\"name\": \"insert\", \"cursor_shape\": \"vertical\", \"cell_percentage\": 25, \"blinkwait\": 700, "
              "\"blinkon\": 400, \"blinkoff\": 250, \"attr_id\": 9}]]], [\"mode_change\", [\"insert\", 1]]]");
  auto& mi = std::get<ModeInfoSetEvent>(ev[0]);
  assert(mi.cursor_style_enabled && mi.infos.size() == 2);
  assert(mi.infos[1].shape == CursorShape::Vertical && mi.infos[1].blinkwait == 700 && mi.infos[1].attr_id == 9);
  assert(std::get<ModeChangeEvent>(ev[1]).index == 1);

  ev = decode("[[\"win_pos\", [2, 1000, 0, 40, 40, 23]], [\"win_float_pos\", [3, 1001, \"SE\", 2, 5.5, 10, true]],"
              " [\"win_float_pos\", [4, 1002, \"NW\", 1, 0, 0, true, 80]], [\"win_hide\", [2]], [\"win_close\", [4]],"
              " [\"msg_set_pos\", [5, 20, false, \"\"]]]");
  assert(std::get<WinPosEvent>(ev[0]).col == 40);
  auto& fp = std::get<WinFloatPosEvent>(ev[1]);
  assert(fp.anchor == Anchor::SE && fp.anchor_grid == 2 && fp.anchor_row == 5 && fp.anchor_col == 10);
  assert(fp.z_index == 50);
  assert(std::get<WinFloatPosEvent>(ev[2]).z_index == 80);
  assert(std::get<WinHideEvent>(ev[3]).grid == 2);
  assert(std::get<WinCloseEvent>(ev[4]).grid == 4);
  assert(std::get<MsgSetPosEvent>(ev[5]).row == 20);

  // window handles may be ext values
  msgpack::sbuffer buf;
  msgpack::packer<msgpack::sbuffer> pk(&buf);
  pk.pack_array(6);
  pk.pack(2);
  pk.pack_ext(1, 1);
  pk.pack_ext_body("\x01", 1);
  pk.pack(0);
  pk.pack(0);
  pk.pack(10);
  pk.pack(5);
  msgpack::object_handle ext_args = msgpack::unpack(buf.data(), buf.size());
  std::vector<Notification> out;
  std::string msg;
  assert(decode_event("win_pos", ext_args.get().via.array, out, msg));
  assert(out.size() == 1);

  ev = decode("[[\"busy_start\", []], [\"busy_stop\", []], [\"mouse_off\", []], [\"option_set\", [\"guifont\", \"x\"], "
              "[\"linespace\", 0]], [\"set_title\", [\"t\"]]]");
  assert(std::get<BusyEvent>(ev[0]).busy && !std::get<BusyEvent>(ev[1]).busy);
  assert(!std::get<MouseEnabledEvent>(ev[2]).enabled);
  assert(std::get<OptionSetEvent>(ev[4]).value == "0");
  assert(std::get<SetTitleEvent>(ev[5]).title == "t");

  ev = decode("[[\"popupmenu_show\", [[[\"foo\", \"f\", \"\", \"\"]], -1, 2, 3, 1]], [\"popupmenu_select\", [0]],"
              " [\"popupmenu_hide\", []]]");
  auto& ps = std::get<PopupMenuShowEvent>(ev[0]);
  assert(ps.items.size() == 1 && ps.items[0].word == "foo" && !ps.selected && ps.grid == 1);
  assert(std::get<PopupMenuSelectEvent>(ev[1]).selected == 0);
  assert(std::holds_alternative<PopupMenuHideEvent>(ev[2]));

  // unknown events are skipped
  ev = decode("[[\"tabline_update\", [1, []]], [\"flush\", []]]");
  assert(ev.size() == 1);

  // malformed shapes name the event; nothing from the batch is kept
  assert(decode_fail("[[\"grid_resize\", [1, 80]]]").find("grid_resize") != std::string::npos);
  assert(decode_fail("[[\"flush\", []], [\"grid_line\", [1, 0, 0, [[5]]]]]").find("grid_line") != std::string::npos);
  decode_fail("[[\"grid_clear\", [\"one\"]]]");
  decode_fail("[[\"win_float_pos\", [3, 1, \"XX\", 1, 0, 0, true]]]");
  decode_fail("[[\"hl_attr_define\", [1, 2, {}, []]]]");
  decode_fail("[[\"grid_resize\", 1]]");
  decode_fail("[[1, []]]");
  decode_fail("{}");

  // integers that do not fit a coordinate are rejected, not wrapped
  assert(decode_fail("[[\"grid_line\", [1, 4294967296, 0, [[\"X\"]]]], [\"flush\", []]]").find("out of range") !=
         std::string::npos);
  decode_fail("[[\"grid_resize\", [1, 2147483648, 24]]]");
  decode_fail("[[\"grid_line\", [1, 0, 0, [[\"a\", 0, 4294967297]]]]]");
  decode_fail("[[\"grid_cursor_goto\", [1, -2147483649, 0]]]");
  decode_fail("[[\"grid_clear\", [18446744073709551615]]]");
  decode_fail("[[\"win_float_pos\", [3, 1, \"NW\", 1, 1e300, 0, true]]]");
  decode_fail("[[\"hl_attr_define\", [1, {\"foreground\": 16777216}, {}, []]]]");
  decode_fail("[[\"mode_info_set\", [true, [{\"blinkon\": 9999999999}]]]]");
  ev = decode("[[\"grid_resize\", [1, 2147483647, 0]]]");
  assert(std::get<GridResizeEvent>(ev[0]).width == 2147483647);

  // a NaN anchor can only come off the wire
  msgpack::sbuffer nan_buf;
  msgpack::packer<msgpack::sbuffer> nan_pk(&nan_buf);
  nan_pk.pack_array(7);
  nan_pk.pack(3);
  nan_pk.pack(1);
  nan_pk.pack(std::string("NW"));
  nan_pk.pack(1);
  nan_pk.pack_double(std::nan(""));
  nan_pk.pack(0);
  nan_pk.pack(true);
  msgpack::object_handle nan_args = msgpack::unpack(nan_buf.data(), nan_buf.size());
  out.clear();
  assert(!decode_event("win_float_pos", nan_args.get().via.array, out, msg));
  assert(out.empty());
  assert(msg.find("win_float_pos") != std::string::npos);
  return 0;
}
