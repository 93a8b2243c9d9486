/**
 * @file x11_window_system.cpp
 * @brief Окно-прицел и синтетический ввод через Xlib
 */

#include "treadle/x11_window_system.hpp"

#include <X11/Xatom.h>
#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <X11/extensions/XTest.h>
#include <X11/extensions/shape.h>

#include <array>
#include <iostream>
#include <mutex>
#include <vector>

namespace treadle {

namespace {

/// Счётчик ошибок соединения, активного в текущем потоке (nullptr - нет)
thread_local unsigned long *t_error_count = nullptr;

/// Ошибки протокола (BadWindow при закрытии уже уничтоженного окна и т.п.)
/// не должны завершать процесс: стандартный обработчик Xlib делает exit().
/// Обработчик вызывается в потоке, который читает ответ сервера, поэтому
/// ошибка засчитывается соединению этого потока.
int log_x_error(Display *display, XErrorEvent *event) {
  std::array<char, 256> text{};
  XGetErrorText(display, event->error_code, text.data(),
                static_cast<int>(text.size()));
  std::cerr << "[treadle-x11] X error: " << text.data()
            << " (request=" << static_cast<int>(event->request_code)
            << " resource=0x" << std::hex << event->resourceid << std::dec
            << ")\n";
  if (t_error_count) {
    ++*t_error_count;
  }
  return 0;
}

std::once_flag g_xlib_once;
bool g_xlib_threads = false;

/// XInitThreads() до любого другого вызова Xlib: окна живут в своих потоках
bool init_xlib() {
  std::call_once(g_xlib_once, [] {
    g_xlib_threads = XInitThreads() != 0;
    if (!g_xlib_threads) {
      std::cerr << "[treadle-x11] Failed to initialize X11 threading support\n";
      return;
    }
    XSetErrorHandler(log_x_error);
  });
  return g_xlib_threads;
}

/// 8 бит -> 16 бит на канал (0xff -> 0xffff)
unsigned short expand_channel(std::uint8_t v) {
  return static_cast<unsigned short>(v * 257);
}

std::uint8_t shrink_channel(unsigned short v) {
  return static_cast<std::uint8_t>(v / 257);
}

// ===========================================================================
// Окно фонового потока
// ===========================================================================

class X11Surface final : public OverlaySurface {
public:
  X11Surface(Display *display, Window window, Atom wm_delete,
             unsigned long pixel)
      : display_{display}, window_{window}, wm_delete_{wm_delete},
        pixel_{pixel} {}

  ~X11Surface() override {
    if (!destroyed_) {
      XDestroyWindow(display_, window_);
    }
    XCloseDisplay(display_);
  }

  X11Surface(const X11Surface &) = delete;
  X11Surface &operator=(const X11Surface &) = delete;

  WindowId id() const noexcept override { return window_; }

  Rgb background() const override {
    XColor color{};
    color.pixel = pixel_;
    XQueryColor(display_, DefaultColormap(display_, DefaultScreen(display_)),
                &color);
    return Rgb{shrink_channel(color.red), shrink_channel(color.green),
               shrink_channel(color.blue)};
  }

  void apply_mask(const ShapeMask &mask, int y_offset) override {
    // XCreateBitmapFromData ожидает формат XBM: ровно то, что хранит маска
    std::vector<char> data(mask.bits().begin(), mask.bits().end());
    Pixmap pixmap = XCreateBitmapFromData(
        display_, window_, data.data(), static_cast<unsigned int>(mask.width()),
        static_cast<unsigned int>(mask.height()));
    if (pixmap == None) {
      std::cerr << "[treadle-x11] Failed to create shape bitmap "
                << mask.width() << "x" << mask.height() << "\n";
      return;
    }

    XShapeCombineMask(display_, window_, ShapeBounding, 0, y_offset, pixmap,
                      ShapeSet);
    XFreePixmap(display_, pixmap);
    XFlush(display_);
  }

  OverlayEvent next_event() override {
    XEvent ev{};
    while (true) {
      XNextEvent(display_, &ev);

      switch (ev.type) {
      case ConfigureNotify: {
        const XConfigureEvent &ce = ev.xconfigure;
        if (ce.window != window_) {
          break;
        }
        OverlayEvent out;
        out.kind = OverlayEvent::Kind::Configure;
        out.width = ce.width;
        out.height = ce.height;
        out.x = ce.x;
        out.y = ce.y;

        // Реальные ConfigureNotify от reparenting WM содержат координаты
        // относительно рамки; синтетические уже в экранных.
        if (!ce.send_event) {
          Window child = None;
          int rx = 0;
          int ry = 0;
          if (XTranslateCoordinates(display_, window_,
                                    DefaultRootWindow(display_), 0, 0, &rx,
                                    &ry, &child)) {
            out.x = rx;
            out.y = ry;
          }
        }
        return out;
      }

      case DestroyNotify:
        if (ev.xdestroywindow.window == window_) {
          destroyed_ = true;
          return OverlayEvent{OverlayEvent::Kind::Destroyed};
        }
        break;

      case ClientMessage:
        if (ev.xclient.window == window_ && ev.xclient.format == 32 &&
            static_cast<Atom>(ev.xclient.data.l[0]) == wm_delete_) {
          return OverlayEvent{OverlayEvent::Kind::DeleteRequested};
        }
        break;

      default:
        break;
      }
    }
  }

private:
  Display *display_;
  Window window_;
  Atom wm_delete_;
  unsigned long pixel_;
  bool destroyed_ = false;
};

// ===========================================================================
// Короткоживущее соединение
// ===========================================================================

class X11Connection final : public DisplayConnection {
public:
  explicit X11Connection(Display *display) : display_{display} {
    previous_ = t_error_count;
    t_error_count = &errors_;
  }

  ~X11Connection() override {
    XCloseDisplay(display_);
    t_error_count = previous_;
  }

  X11Connection(const X11Connection &) = delete;
  X11Connection &operator=(const X11Connection &) = delete;

  bool warp_pointer(Point to) override {
    return XWarpPointer(display_, None, DefaultRootWindow(display_), 0, 0, 0,
                        0, to.x, to.y) != 0;
  }

  bool button(unsigned int button, bool pressed) override {
    return XTestFakeButtonEvent(display_, button, pressed ? True : False,
                                CurrentTime) != 0;
  }

  bool sync() override {
    const unsigned long before = errors_;
    XSync(display_, False);
    return errors_ == before;
  }

  bool destroy_window(WindowId id) override {
    return XDestroyWindow(display_, static_cast<Window>(id)) != 0;
  }

private:
  Display *display_;
  unsigned long errors_ = 0;
  unsigned long *previous_ = nullptr;
};

} // namespace

X11WindowSystem::X11WindowSystem() : threads_ready_{init_xlib()} {}

X11WindowSystem::~X11WindowSystem() = default;

WindowSystem::CreateOutcome
X11WindowSystem::create_overlay(const OverlayRequest &request) {
  CreateOutcome out;

  if (!threads_ready_) {
    out.result = SetupError::ResourceUnavailable;
    out.error = "X11 threading support unavailable";
    return out;
  }

  Display *display = XOpenDisplay(nullptr);
  if (!display) {
    out.result = SetupError::ResourceUnavailable;
    out.error = "cannot open X display";
    return out;
  }

  int shape_event_base = 0;
  int shape_error_base = 0;
  if (!XShapeQueryExtension(display, &shape_event_base, &shape_error_base)) {
    XCloseDisplay(display);
    out.result = SetupError::PlatformCapability;
    out.error = "X server has no SHAPE extension";
    return out;
  }

  // Клик делается через XTest: без него окно бесполезно
  int xtest_event_base = 0;
  int xtest_error_base = 0;
  int xtest_major = 0;
  int xtest_minor = 0;
  if (!XTestQueryExtension(display, &xtest_event_base, &xtest_error_base,
                           &xtest_major, &xtest_minor)) {
    XCloseDisplay(display);
    out.result = SetupError::PlatformCapability;
    out.error = "X server has no XTEST extension";
    return out;
  }

  const int screen = DefaultScreen(display);
  const Window root = RootWindow(display, screen);
  const int size = request.geometry.natural_size();

  XColor color{};
  color.red = expand_channel(request.color.red);
  color.green = expand_channel(request.color.green);
  color.blue = expand_channel(request.color.blue);
  color.flags = DoRed | DoGreen | DoBlue;
  if (!XAllocColor(display, DefaultColormap(display, screen), &color)) {
    std::cerr << "[treadle-x11] XAllocColor failed, using black\n";
    color.pixel = BlackPixel(display, screen);
  }

  XSetWindowAttributes attrs{};
  attrs.background_pixel = color.pixel;
  attrs.event_mask = StructureNotifyMask;

  // За пределами экрана, пока оконный менеджер не выставит позицию
  Window window = XCreateWindow(
      display, root, -size, -size, static_cast<unsigned int>(size),
      static_cast<unsigned int>(size), 0, CopyFromParent, InputOutput,
      CopyFromParent, CWBackPixel | CWEventMask, &attrs);

  XStoreName(display, window, request.title.c_str());

  // Normal state, без захвата фокуса
  XWMHints wm_hints{};
  wm_hints.flags = StateHint | InputHint;
  wm_hints.initial_state = NormalState;
  wm_hints.input = False;
  XSetWMHints(display, window, &wm_hints);

  XSizeHints size_hints{};
  size_hints.flags = PMinSize;
  size_hints.min_width = size;
  size_hints.min_height = size;
  XSetWMNormalHints(display, window, &size_hints);

  Atom window_type = XInternAtom(display, "_NET_WM_WINDOW_TYPE", False);
  Atom type_dialog = XInternAtom(display, "_NET_WM_WINDOW_TYPE_DIALOG", False);
  XChangeProperty(display, window, window_type, XA_ATOM, 32, PropModeReplace,
                  reinterpret_cast<unsigned char *>(&type_dialog), 1);

  Atom wm_delete = XInternAtom(display, "WM_DELETE_WINDOW", False);
  XSetWMProtocols(display, window, &wm_delete, 1);

  XMapWindow(display, window);
  XFlush(display);

  out.surface =
      std::make_unique<X11Surface>(display, window, wm_delete, color.pixel);
  out.result = SetupError::Ok;
  return out;
}

std::unique_ptr<DisplayConnection> X11WindowSystem::connect() {
  if (!threads_ready_) {
    return nullptr;
  }

  Display *display = XOpenDisplay(nullptr);
  if (!display) {
    std::cerr << "[treadle-x11] Error: cannot open X display\n";
    return nullptr;
  }

  return std::make_unique<X11Connection>(display);
}

} // namespace treadle
