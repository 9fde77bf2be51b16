#ifdef PC_HAS_GLFW

#include "pc/gl/GlfwContext.hpp"
#include <glad/gl.h>
#include <GLFW/glfw3.h>
#include <cstdio>

namespace pc {

GlfwContext::GlfwContext() = default;

GlfwContext::~GlfwContext() {
  if (window_) {
    glfwDestroyWindow(window_);
  }
  glfwTerminate();
}

bool GlfwContext::init(int width, int height) {
  if (!glfwInit()) {
    std::fprintf(stderr, "GlfwContext::init: glfwInit failed\n");
    return false;
  }

  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
  glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
  glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
  glfwWindowHint(GLFW_STENCIL_BITS, 8);
  glfwWindowHint(GLFW_SAMPLES, 4);

  window_ = glfwCreateWindow(width, height, "PriceChart", nullptr, nullptr);
  if (!window_) {
    std::fprintf(stderr, "GlfwContext::init: glfwCreateWindow failed\n");
    glfwTerminate();
    return false;
  }

  glfwMakeContextCurrent(window_);
  glfwSwapInterval(1);

  int version = gladLoadGL((GLADloadfunc)glfwGetProcAddress);
  if (!version) {
    std::fprintf(stderr, "GlfwContext::init: gladLoadGL failed\n");
    glfwDestroyWindow(window_);
    window_ = nullptr;
    glfwTerminate();
    return false;
  }

  glfwGetFramebufferSize(window_, &width_, &height_);

  // Install callbacks
  glfwSetWindowUserPointer(window_, this);
  glfwSetCursorPosCallback(window_, cursorPosCallback);
  glfwSetCursorEnterCallback(window_, cursorEnterCallback);
  glfwSetMouseButtonCallback(window_, mouseButtonCallback);

  return true;
}

void GlfwContext::swapBuffers() {
  if (window_) {
    glfwSwapBuffers(window_);
  }
}

std::vector<std::uint8_t> GlfwContext::readPixels() const {
  std::vector<std::uint8_t> pixels(static_cast<std::size_t>(width_) * height_ * 4);
  glReadPixels(0, 0, width_, height_, GL_RGBA, GL_UNSIGNED_BYTE, pixels.data());
  return pixels;
}

void GlfwContext::setTitle(const char* title) {
  if (window_) glfwSetWindowTitle(window_, title);
}

bool GlfwContext::shouldClose() const {
  return window_ && glfwWindowShouldClose(window_);
}

double GlfwContext::nowMs() const {
  return glfwGetTime() * 1000.0;
}

std::vector<PointerEvent> GlfwContext::pollEvents() {
  glfwPollEvents();

  if (window_) {
    glfwGetFramebufferSize(window_, &width_, &height_);
  }

  std::vector<PointerEvent> out;
  out.swap(pending_);
  return out;
}

void GlfwContext::push(PointerEventType type, double x, double y) {
  PointerEvent ev;
  ev.type = type;
  ev.pointerId = 1;
  ev.x = x;
  ev.y = y;
  ev.timeMs = nowMs();
  pending_.push_back(ev);
}

void GlfwContext::cursorPosCallback(GLFWwindow* w, double x, double y) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self) return;
  self->inside_ = true;
  self->push(PointerEventType::Move, x, y);
}

void GlfwContext::cursorEnterCallback(GLFWwindow* w, int entered) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self) return;
  self->inside_ = (entered == GLFW_TRUE);
  // A pressed pointer is captured; it only leaves when released outside.
  if (!self->inside_ && !self->pressed_) {
    self->push(PointerEventType::Leave, -1, -1);
  }
}

void GlfwContext::mouseButtonCallback(GLFWwindow* w, int button, int action, int /*mods*/) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self || button != GLFW_MOUSE_BUTTON_LEFT) return;

  double x = 0, y = 0;
  glfwGetCursorPos(w, &x, &y);
  if (action == GLFW_PRESS) {
    self->pressed_ = true;
    self->push(PointerEventType::Down, x, y);
  } else if (action == GLFW_RELEASE) {
    self->pressed_ = false;
    self->push(PointerEventType::Up, x, y);
    if (!self->inside_) self->push(PointerEventType::Leave, -1, -1);
  }
}

} // namespace pc

#endif // PC_HAS_GLFW
