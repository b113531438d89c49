/**
 * Entry point.
 */

#include "os_agnostic/ScrollerConsole.hpp"
#include <iostream>

int main() {
  std::ios::sync_with_stdio(false);
  std::cin.tie(nullptr);

  // Welcome banner
  std::cout << "\n\n***********************************************\n\n"
            << "Welcome to the Text Scroller Console!\n\n"
            << "Type text with 'show <text>' and watch it scroll\n"
            << "up the 320x240 display preview below, credits style.\n\n"
            << "Tip: Type 'help' to see available commands.\n"
            << "\n***********************************************\n"
            << std::flush;

  ScrollerConsole console;
  console.run();

  std::cout << "Finished Execution!\n";
  return 0;
}
