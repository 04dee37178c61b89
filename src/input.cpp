#include "input.hpp"
#include <cctype>
#include <ncurses.h>

static size_t utf8_length(const std::string& s) {
  size_t n = 0;
  for (unsigned char c : s)
    if ((c & 0xC0) != 0x80) n++;
  return n;
}

std::string to_input_string(const std::string& key, Modifiers mods) {
  if (key.empty()) return key;
  std::string val = key;
  // CTRL-^ and CTRL-@ are typed as Ctrl-6 and Ctrl-2
  if (mods.ctrl && !mods.shift && !mods.alt) {
    if (val == "6") val = "^";
    else if (val == "2") val = "@";
  }
  if (key.size() == 1) {
    unsigned char ch = static_cast<unsigned char>(key[0]);
    if (ch < 0x80 && !std::isalnum(ch)) mods.shift = false;
  }
  if (val == "<") val = "lt";
  std::string out;
  if (mods.shift) out += "S-";
  if (mods.ctrl) out += "C-";
  if (mods.alt) out += "A-";
  out += val;
  if (utf8_length(out) > 1) return "<" + out + ">";
  return out;
}

static const char* key_name(int ch) {
  switch (ch) {
    case 27: return "Esc";
    case '\n': case '\r': case KEY_ENTER: return "CR";
    case 127: case KEY_BACKSPACE: case 8: return "BS";
    case '\t': return "Tab";
    case KEY_UP: return "Up";
    case KEY_DOWN: return "Down";
    case KEY_LEFT: return "Left";
    case KEY_RIGHT: return "Right";
    case KEY_HOME: return "Home";
    case KEY_END: return "End";
    case KEY_PPAGE: return "PageUp";
    case KEY_NPAGE: return "PageDown";
    case KEY_DC: return "Del";
    case KEY_IC: return "Insert";
    default: return nullptr;
  }
}

std::string Input::translate(int ch, Modifiers mods) const {
  if (ch == KEY_BTAB) return to_input_string("Tab", Modifiers{true, mods.ctrl, mods.alt});
  if (ch >= KEY_F(1) && ch <= KEY_F(12)) return to_input_string("F" + std::to_string(ch - KEY_F(0)), mods);
  if (const char* name = key_name(ch)) return to_input_string(name, mods);
  if (ch == 0) return to_input_string("@", Modifiers{false, true, mods.alt});
  if (ch >= 1 && ch <= 26) return to_input_string(std::string(1, static_cast<char>('a' + ch - 1)),
                                                  Modifiers{false, true, mods.alt});
  if (ch >= 28 && ch <= 31) return to_input_string(std::string(1, static_cast<char>('\\' + ch - 28)),
                                                   Modifiers{false, true, mods.alt});
  if (ch == ' ' && mods.alt) return to_input_string("Space", mods);
  if (ch >= 32 && ch < 127) return to_input_string(std::string(1, static_cast<char>(ch)), mods);
  // utf-8 continuation and lead bytes go through as they come
  if (ch >= 128 && ch < 256) return std::string(1, static_cast<char>(ch));
  return {};
}

std::string Input::consume(int ch) {
  if (pending_esc_) {
    pending_esc_ = false;
    if (ch == 27) { pending_esc_ = true; return "<Esc>"; }
    return translate(ch, Modifiers{false, false, true});
  }
  if (ch == 27) { pending_esc_ = true; return {}; }
  return translate(ch, {});
}

std::string Input::flush() {
  if (!pending_esc_) return {};
  pending_esc_ = false;
  return "<Esc>";
}
