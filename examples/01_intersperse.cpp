// ============================================================================
// Example 01: Intersperse
// ============================================================================
//
// Renders a list as "[a, b, c]" by interspersing a start marker, a
// separator and an end marker, then shows that an empty list produces
// nothing but the completion signal.
//
// RUN:
//   cd build && ./01_intersperse
//
// ============================================================================

#include "rivulet/rivulet.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace rivulet;

static void Render(const std::vector<std::string>& items, Scheduler& scheduler, TestExecutor& executor) {
    std::string line;
    Subscribe(
        Intersperse(FromIterable(items), "[", ", ", "]"), scheduler, [&](const std::string& s) { line += s; },
        [](Error e) { std::cout << "  error: " << e.message() << std::endl; },
        [&] { std::cout << "  rendered: '" << line << "'" << std::endl; });
    executor.Tick();
}

int main() {
    std::cout << "=== Rivulet Example 01: Intersperse ===" << std::endl;
    std::cout << std::endl;

    TestExecutor executor;
    Scheduler scheduler(executor);

    std::cout << "--- Three elements ---" << std::endl;
    Render({"a", "b", "c"}, scheduler, executor);

    std::cout << "--- One element ---" << std::endl;
    Render({"solo"}, scheduler, executor);

    std::cout << "--- Empty (no markers at all) ---" << std::endl;
    Render({}, scheduler, executor);

    return 0;
}
