/**
 * SFML implementation of the window sink and viewer.
 */
#include "WindowSink.hpp"
#include "../os_agnostic/DisplayConfig.hpp"

DeliveryStatus WindowSink::deliver(const Frame& frame) {
  std::lock_guard<std::mutex> lock(mtx);
  if (closed) return DeliveryStatus::failure("window closed");
  latest = frame;
  fresh = true;
  return DeliveryStatus::success();
}

bool WindowSink::takeLatest(Frame& out) {
  std::lock_guard<std::mutex> lock(mtx);
  if (!fresh) return false;
  out = latest;
  fresh = false;
  return true;
}

void WindowSink::markClosed() {
  std::lock_guard<std::mutex> lock(mtx);
  closed = true;
}

WindowViewer::WindowViewer(const std::string& title, int width, int height, unsigned scale)
  : window(sf::VideoMode(static_cast<unsigned>(width) * scale, static_cast<unsigned>(height) * scale),
           title, sf::Style::Titlebar | sf::Style::Close),
    rgba(static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4, 0)
{
  window.setFramerateLimit(60);
  texture.create(static_cast<unsigned>(width), static_cast<unsigned>(height));
  sprite.setTexture(texture);
  sprite.setScale(static_cast<float>(scale), static_cast<float>(scale));
}

// RGB565 -> RGBA8888 for sf::Texture::update.
void WindowViewer::upload(const Frame& frame) {
  const auto size = texture.getSize();
  if (static_cast<unsigned>(frame.width()) != size.x || static_cast<unsigned>(frame.height()) != size.y) {
    return;
  }
  const auto& px = frame.pixels();
  for (std::size_t i = 0; i < px.size(); ++i) {
    const Color c = Color::fromRgb565(px[i]);
    rgba[i * 4 + 0] = c.r;
    rgba[i * 4 + 1] = c.g;
    rgba[i * 4 + 2] = c.b;
    rgba[i * 4 + 3] = 255;
  }
  texture.update(rgba.data());
}

bool WindowViewer::present(WindowSink& sink) {
  sf::Event event;
  while (window.pollEvent(event)) {
    if (event.type == sf::Event::Closed ||
        (event.type == sf::Event::KeyPressed && event.key.code == sf::Keyboard::Escape)) {
      sink.markClosed();
      window.close();
      return false;
    }
  }

  Frame frame;
  if (sink.takeLatest(frame)) upload(frame);

  window.clear(sf::Color::Black);
  window.draw(sprite);
  window.display();
  return true;
}
