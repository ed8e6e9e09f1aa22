#include "app.h"
#include "config.h"
#include "log.h"
#include "menu.h"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::string config_path = "expense_tracker.conf";
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-c" && i + 1 < argc) {
            config_path = argv[++i];
            continue;
        }
        args.push_back(a);
    }

    Config cfg;
    Status st = load_config(config_path, cfg);
    if (!st.ok()) {
        std::cerr << "❌ 配置文件有误：" << config_path << "\n";
        print_status(st, std::cerr);
        return 1;
    }
    set_log_level(cfg.log_level);

    App app(cfg);
    return app.run(args);
}
