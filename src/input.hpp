#pragma once
#include <string>
/*
 * Input
 *
 * Purpose: translate terminal key codes into the editor's key notation
 *          (<Esc>, <C-a>, <lt>, <S-Tab>, <F5>, ...).
 * State: a lone ESC is held until the next key so ESC+key reads as Alt+key.
 */

struct Modifiers {
  bool shift = false;
  bool ctrl = false;
  bool alt = false;
};

// key is one character or a key name ("BS", "Up", "F5"); result wraps
// anything longer than one char in <...>
std::string to_input_string(const std::string& key, Modifiers mods);

class Input {
public:
  // empty result: nothing to send yet (or untranslatable key)
  std::string consume(int ch);
  // emits a held ESC once the key timeout passed
  std::string flush();
  bool pending() const { return pending_esc_; }
  void reset() { pending_esc_ = false; }
private:
  std::string translate(int ch, Modifiers mods) const;
  bool pending_esc_ = false;
};
