#include "CacheDemoApp.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        tiercache::CacheDemoApp app;
        int code = app.run(argc, argv);
        std::cout << "[main] Demo finished with code " << code << std::endl;
        return code;
    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
