#ifndef BUTTON_STATE_H
#define BUTTON_STATE_H

/// State of the mouse buttons
struct ButtonState
{
  /// Update from a GLFW mouse button event. Use -1 to ignore the button.
  void updateFromGlfwEvent(int mouseButton, int mouseButtonAction);

  bool anyPressed() const { return (left || right || middle); }

  bool left = false;
  bool right = false;
  bool middle = false;
};

/// State of the keyboard modifiers
struct ModifierState
{
  /// Update from GLFW key modifier bits. Use -1 to ignore the modifiers.
  void updateFromGlfwEvent(int keyMods);

  /// Number of pressed modifiers among Shift, Control, and Alt.
  /// Super and the lock keys do not count towards track editing.
  int numEditModifiers() const;

  bool shift = false;
  bool control = false;
  bool alt = false;
  bool super = false;
  bool capsLock = false;
  bool numLock = false;
};

#endif // BUTTON_STATE_H
