#include "AutoConfig.h"
#include "AutomationPipeline.h"
#include "MarqueeExceptions.h"

#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc >= 2) {
        const std::string first = argv[1];
        if (first == "--help" || first == "-h") {
            std::cout << AutoConfig::usage() << "\n";
            return 0;
        }
    }

    std::cout << "Marquee: Exploratory Data Analysis Engine\n";
    try {
        AutoConfig config = AutoConfig::fromArgs(argc, argv);
        AutomationPipeline pipeline;
        return pipeline.run(config);
    } catch (const Marquee::ConfigurationException& e) {
        std::cerr << "[Marquee][Error] " << e.what() << "\n";
        return 2;
    } catch (const Marquee::MarqueeException& e) {
        std::cerr << "[Marquee][Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Marquee][Exception] " << e.what() << "\n";
        return 1;
    }
}
