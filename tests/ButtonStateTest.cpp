#include "logic/interaction/events/ButtonState.h"

#include <gtest/gtest.h>

TEST(ButtonState, TracksGlfwButtons)
{
  ButtonState b;
  EXPECT_FALSE(b.anyPressed());

  b.updateFromGlfwEvent(0, 1); // left press
  EXPECT_TRUE(b.left);
  EXPECT_TRUE(b.anyPressed());

  b.updateFromGlfwEvent(2, 1); // middle press
  b.updateFromGlfwEvent(0, 0); // left release
  EXPECT_FALSE(b.left);
  EXPECT_TRUE(b.middle);

  b.updateFromGlfwEvent(-1, 1);
  EXPECT_TRUE(b.middle);
  EXPECT_FALSE(b.right);
}

TEST(ModifierState, CountsEditModifiers)
{
  ModifierState m;
  EXPECT_EQ(0, m.numEditModifiers());

  m.updateFromGlfwEvent(0x0001 | 0x0002); // shift, control
  EXPECT_TRUE(m.shift);
  EXPECT_TRUE(m.control);
  EXPECT_FALSE(m.alt);
  EXPECT_EQ(2, m.numEditModifiers());

  m.updateFromGlfwEvent(0x0004 | 0x0008 | 0x0010); // alt, super, caps lock
  EXPECT_TRUE(m.alt);
  EXPECT_TRUE(m.super);
  EXPECT_TRUE(m.capsLock);
  EXPECT_EQ(1, m.numEditModifiers());

  m.updateFromGlfwEvent(-1);
  EXPECT_TRUE(m.alt);
}
