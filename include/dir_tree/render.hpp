#pragma once
#include <string>
#include <ostream>
#include "dir_tree/types.hpp"

namespace dir_tree {
    std::string dir_tree_to_json(const DirTree& tree);
    void render_json(const TreeReport& report, std::ostream& out);
}
