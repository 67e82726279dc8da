#include "kiln/builder.hpp"

namespace kiln {

Result<void> KilnBuilder::add_task(Task &&task) {
    auto res = graph_.add_task(std::move(task));
    if (!res) {
        return std::unexpected(res.error());
    }
    return {};
}

} // namespace kiln
