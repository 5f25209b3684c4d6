#include "stacknav/gui.hpp"
#include "backends/imgui_impl_glfw.h"
#include "backends/imgui_impl_opengl3.h"
#include "imgui.h"
#include "stacknav/logger.hpp"
#include <GLFW/glfw3.h>

namespace stacknav {

static void glfw_error_callback(int error, const char *description) {
  LOG_ERROR("GLFW Error " + std::to_string(error) + ": " +
            std::string(description));
}

GUI &GUI::instance() {
  static GUI instance;
  return instance;
}

bool GUI::init(const WindowConfig &config) {
  glfwSetErrorCallback(glfw_error_callback);
  if (!glfwInit()) {
    LOG_ERROR("Failed to initialize GLFW");
    return false;
  }

  const char *glsl_version = "#version 130";
  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);
  glfwWindowHint(GLFW_RESIZABLE, config.resizable ? GLFW_TRUE : GLFW_FALSE);
  glfwWindowHint(GLFW_VISIBLE, GLFW_TRUE);
  glfwWindowHint(GLFW_DOUBLEBUFFER, GLFW_TRUE);

  GLFWwindow *window = glfwCreateWindow(config.width, config.height,
                                        config.title.c_str(), NULL, NULL);
  if (window == nullptr) {
    LOG_ERROR("Failed to create GLFW window");
    glfwTerminate();
    return false;
  }

  glfwMakeContextCurrent(window);
  glfwSwapInterval(1);

  IMGUI_CHECKVERSION();
  ImGui::CreateContext();
  ImGuiIO &io = ImGui::GetIO();
  io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
  io.IniFilename = nullptr;

  ImGui::StyleColorsDark();
  ImGuiStyle &style = ImGui::GetStyle();
  style.WindowRounding = 0.0f;
  style.FrameRounding = 6.0f;
  style.PopupRounding = 6.0f;
  style.WindowPadding = ImVec2(16, 16);
  style.FramePadding = ImVec2(12, 6);
  style.ItemSpacing = ImVec2(10, 8);

  ImGui_ImplGlfw_InitForOpenGL(window, true);
  ImGui_ImplOpenGL3_Init(glsl_version);

  // Mutations made outside of input handling still need to unblock
  // glfwWaitEventsTimeout so the next frame shows them.
  cx_.setWakeHandler([]() { glfwPostEmptyEvent(); });

  window_ = window;
  initialized_ = true;
  LOG_INFO("Window created (" + std::to_string(config.width) + "x" +
           std::to_string(config.height) + ")");
  return true;
}

void GUI::run(const Entity<AppState> &app, int idleTimeoutMs) {
  if (!initialized_ || !app)
    return;

  GLFWwindow *window = (GLFWwindow *)window_;
  const double idleTimeout = idleTimeoutMs / 1000.0;

  while (!glfwWindowShouldClose(window) && !shouldClose_) {
    if (cx_.takeNotify())
      glfwPollEvents();
    else
      glfwWaitEventsTimeout(idleTimeout);

    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();

    const ImGuiViewport *viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);

    ImGuiWindowFlags windowFlags = ImGuiWindowFlags_NoDecoration |
                                   ImGuiWindowFlags_NoMove |
                                   ImGuiWindowFlags_NoBringToFrontOnFocus |
                                   ImGuiWindowFlags_NoSavedSettings;
    ImGui::Begin("stacknav_container", nullptr, windowFlags);

    renderTitleBar(*app, viewport->WorkSize.x);

    // Local strong reference: the screen may pop itself while drawing.
    Entity<Screen> screen = app->navigator().currentEntity();
    float footerHeight = ImGui::GetFrameHeightWithSpacing();
    ImGui::BeginChild("screen_body", ImVec2(0, -footerHeight));
    if (screen) {
      screen->render(cx_);
    } else {
      ImGui::TextDisabled("Nothing to display");
    }
    ImGui::EndChild();

    renderStatusLine(*app);
    renderMessageModal();

    ImGui::End();

    ImGui::Render();
    int fb_width, fb_height;
    glfwGetFramebufferSize(window, &fb_width, &fb_height);
    glViewport(0, 0, fb_width, fb_height);
    glClearColor(0.1f, 0.1f, 0.12f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
    glfwSwapBuffers(window);

    screen.reset();
    std::size_t dropped = cx_.collect();
    if (dropped > 0)
      LOG_DEBUG("Released " + std::to_string(dropped) + " screen(s)");
  }
}

void GUI::renderTitleBar(AppState &app, float width) {
  Navigator &nav = app.navigator();
  float barHeight = ImGui::GetFrameHeight() + 8.0f;

  ImVec2 windowPos = ImGui::GetWindowPos();
  ImGui::GetWindowDrawList()->AddRectFilled(
      windowPos, ImVec2(windowPos.x + width, windowPos.y + barHeight),
      IM_COL32(40, 44, 52, 255));

  ImGui::SetCursorPos(ImVec2(8.0f, 4.0f));
  ImGui::BeginDisabled(!nav.canGoBack());
  bool back = ImGui::Button("< Back");
  ImGui::EndDisabled();

  // Escape belongs to an open modal, not to navigation.
  if (nav.canGoBack() &&
      !ImGui::IsPopupOpen("", ImGuiPopupFlags_AnyPopupId) &&
      ImGui::IsKeyPressed(ImGuiKey_Escape, false))
    back = true;
  if (back && nav.canGoBack())
    nav.pop(cx_);

  ImGui::SameLine();
  Screen *current = nav.current();
  std::string title = current ? current->title() : "stacknav";
  ImGui::SetCursorPosX((width - ImGui::CalcTextSize(title.c_str()).x) * 0.5f);
  ImGui::AlignTextToFramePadding();
  ImGui::TextUnformatted(title.c_str());

  ImGui::SetCursorPosY(barHeight + 8.0f);
}

void GUI::renderStatusLine(const AppState &app) {
  ImGui::Separator();
  std::string status = app.describe();
  ImGui::TextDisabled("%s", status.c_str());
}

void GUI::renderMessageModal() {
  if (showMessageModal_)
    ImGui::OpenPopup(messageTitle_.c_str());
  if (ImGui::BeginPopupModal(messageTitle_.c_str(), NULL,
                             ImGuiWindowFlags_AlwaysAutoResize)) {
    ImGui::TextWrapped("%s", messageText_.c_str());
    ImGui::Spacing();
    ImGui::Separator();
    ImGui::Spacing();
    if (ImGui::Button("OK", ImVec2(120, 30))) {
      showMessageModal_ = false;
      ImGui::CloseCurrentPopup();
    }
    ImGui::EndPopup();
  }
}

void GUI::showMessage(const std::string &title, const std::string &message) {
  messageTitle_ = title;
  messageText_ = message;
  showMessageModal_ = true;
  cx_.notify();
}

void GUI::close() {
  shouldClose_ = true;
  cx_.notify();
}

void GUI::shutdown() {
  if (!initialized_)
    return;

  cx_.setWakeHandler(nullptr);
  cx_.collect();

  ImGui_ImplOpenGL3_Shutdown();
  ImGui_ImplGlfw_Shutdown();
  ImGui::DestroyContext();

  if (window_) {
    glfwDestroyWindow((GLFWwindow *)window_);
    window_ = nullptr;
  }
  glfwTerminate();
  initialized_ = false;
}

GUI::~GUI() { shutdown(); }

} // namespace stacknav
