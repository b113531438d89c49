/**
 * SFML desktop window standing in for the SPI panel.
 *
 * Render threads deliver into WindowSink; the thread that created the
 * window (SFML windows belong to one thread) calls WindowViewer::present()
 * to show the newest frame.
 */
#pragma once

#include "../os_agnostic/FrameSink.hpp"

#include <SFML/Graphics.hpp>

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

class WindowSink : public FrameSink {
public:
  // Stores the frame for the window thread; fails once the window is closed.
  DeliveryStatus deliver(const Frame& frame) override;

  // Copies the newest frame into `out` if one arrived since the last call.
  bool takeLatest(Frame& out);

  void markClosed();

private:
  std::mutex mtx;
  Frame latest;
  bool fresh{false};
  bool closed{false};
};

class WindowViewer {
public:
  WindowViewer(const std::string& title, int width, int height, unsigned scale = 2);

  bool isOpen() const { return window.isOpen(); }

  // Handles window events and draws the newest frame. Returns false once closed.
  bool present(WindowSink& sink);

private:
  void upload(const Frame& frame);

  sf::RenderWindow window;
  sf::Texture texture;
  sf::Sprite sprite;
  std::vector<sf::Uint8> rgba;
};
