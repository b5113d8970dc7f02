#pragma once

#include <iosfwd>
#include <vector>

namespace ad::sync {

namespace model {
struct Action;
}

class Executor {
public:
    struct Result {
        size_t copied = 0;
        size_t skipped = 0;   // refused by the filesystem, logged
    };

    // With dryRun, prints "cp <source> <destination>" per action to out and touches nothing.
    static Result run(const std::vector<model::Action>& plan, bool dryRun, std::ostream& out);

private:
    // Returns false when the copy was refused with a permission error.
    static bool dispatch(const model::Action& action);
};

}
