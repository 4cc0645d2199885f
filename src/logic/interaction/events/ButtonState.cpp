#include "logic/interaction/events/ButtonState.h"

namespace
{

// Values match the GLFW 3 API, which this file does not include
constexpr int sk_glfwPress = 1;

constexpr int sk_glfwMouseButtonLeft = 0;
constexpr int sk_glfwMouseButtonRight = 1;
constexpr int sk_glfwMouseButtonMiddle = 2;

constexpr int sk_glfwModShift = 0x0001;
constexpr int sk_glfwModControl = 0x0002;
constexpr int sk_glfwModAlt = 0x0004;
constexpr int sk_glfwModSuper = 0x0008;
constexpr int sk_glfwModCapsLock = 0x0010;
constexpr int sk_glfwModNumLock = 0x0020;

} // namespace

void ButtonState::updateFromGlfwEvent(int mouseButton, int mouseButtonAction)
{
  if (mouseButton < 0)
  {
    return;
  }

  const bool pressed = (sk_glfwPress == mouseButtonAction);

  switch (mouseButton)
  {
  case sk_glfwMouseButtonLeft: left = pressed; break;
  case sk_glfwMouseButtonRight: right = pressed; break;
  case sk_glfwMouseButtonMiddle: middle = pressed; break;
  default: break;
  }
}

void ModifierState::updateFromGlfwEvent(int keyMods)
{
  if (keyMods < 0)
  {
    return;
  }

  shift = (0 != (sk_glfwModShift & keyMods));
  control = (0 != (sk_glfwModControl & keyMods));
  alt = (0 != (sk_glfwModAlt & keyMods));
  super = (0 != (sk_glfwModSuper & keyMods));
  capsLock = (0 != (sk_glfwModCapsLock & keyMods));
  numLock = (0 != (sk_glfwModNumLock & keyMods));
}

int ModifierState::numEditModifiers() const
{
  return (shift ? 1 : 0) + (control ? 1 : 0) + (alt ? 1 : 0);
}
