#ifndef GLFW_CALLBACKS_H
#define GLFW_CALLBACKS_H

struct GLFWwindow;

void errorCallback( int error, const char* description );
void windowCloseCallback( GLFWwindow* window );
void windowSizeCallback( GLFWwindow* window, int windowWidth, int windowHeight );
void framebufferSizeCallback( GLFWwindow* window, int fbWidth, int fbHeight );
void cursorPosCallback( GLFWwindow* window, double windowCursorPosX, double windowCursorPosY );
void mouseButtonCallback( GLFWwindow* window, int button, int action, int mods );
void scrollCallback( GLFWwindow* window, double offsetX, double offsetY );
void keyCallback( GLFWwindow* window, int key, int scancode, int action, int mods );
void dropCallback( GLFWwindow* window, int count, const char** paths );

#endif // GLFW_CALLBACKS_H
