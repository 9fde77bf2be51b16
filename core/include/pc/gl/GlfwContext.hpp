#pragma once
#include "pc/gl/GlContext.hpp"

#ifdef PC_HAS_GLFW

#include <vector>

struct GLFWwindow;

namespace pc {

enum class PointerEventType : std::uint8_t {
  Down,
  Move,
  Up,
  Leave
};

// One pointer event in window pixels, stamped with the glfw clock.
struct PointerEvent {
  PointerEventType type{PointerEventType::Move};
  int pointerId{0};
  double x{0};
  double y{0};
  double timeMs{0};
};

class GlfwContext : public GlContext {
public:
  GlfwContext();
  ~GlfwContext() override;

  GlfwContext(const GlfwContext&) = delete;
  GlfwContext& operator=(const GlfwContext&) = delete;

  bool init(int width, int height) override;
  void swapBuffers() override;

  int width() const override { return width_; }
  int height() const override { return height_; }

  std::vector<std::uint8_t> readPixels() const override;

  void setTitle(const char* title);

  // Poll window events; returns pointer events accumulated since the last
  // call, in arrival order. Sizes reflect the latest framebuffer size.
  std::vector<PointerEvent> pollEvents();
  bool shouldClose() const;

  // Milliseconds since glfwInit.
  double nowMs() const;

private:
  GLFWwindow* window_{nullptr};
  int width_{0};
  int height_{0};
  bool pressed_{false};
  bool inside_{false};

  std::vector<PointerEvent> pending_;

  void push(PointerEventType type, double x, double y);

  static void cursorPosCallback(GLFWwindow* w, double x, double y);
  static void cursorEnterCallback(GLFWwindow* w, int entered);
  static void mouseButtonCallback(GLFWwindow* w, int button, int action, int mods);
};

} // namespace pc

#endif // PC_HAS_GLFW
