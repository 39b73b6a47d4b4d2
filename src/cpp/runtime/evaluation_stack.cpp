#include <reactree/runtime/evaluation_stack.h>
#include <reactree/util/errors.h>

#include <vector>

namespace reactree {
    namespace {
        std::vector<subscriber_ptr> &targets() {
            static std::vector<subscriber_ptr> stack;
            return stack;
        }
    } // namespace

    void EvaluationStack::push(subscriber_ptr target) { targets().push_back(target); }

    void EvaluationStack::pop() {
        auto &stack = targets();
        if (stack.empty()) { throw_error<std::logic_error>("EvaluationStack::pop called on an empty stack"); }
        stack.pop_back();
    }

    subscriber_ptr EvaluationStack::current() {
        auto &stack = targets();
        return stack.empty() ? nullptr : stack.back();
    }

    std::size_t EvaluationStack::depth() { return targets().size(); }

    EvaluationScope::EvaluationScope(subscriber_ptr target) { EvaluationStack::push(target); }

    EvaluationScope::~EvaluationScope() { targets().pop_back(); }
} // namespace reactree
