#ifndef REACTREE_EVALUATION_STACK_H
#define REACTREE_EVALUATION_STACK_H

#include <reactree/reactree_base.h>

namespace reactree {
    /**
     * The stack of subscribers currently evaluating. Reactive reads register with the top of the stack.
     * A nullptr entry suspends dependency collection for everything evaluated above it.
     */
    struct REACTREE_EXPORT EvaluationStack {
        static void push(subscriber_ptr target);

        static void pop();

        [[nodiscard]] static subscriber_ptr current();

        [[nodiscard]] static std::size_t depth();
    };

    /**
     * Pushes a target for the lifetime of the scope.
     */
    struct REACTREE_EXPORT EvaluationScope {
        explicit EvaluationScope(subscriber_ptr target);

        ~EvaluationScope();

        EvaluationScope(const EvaluationScope &) = delete;

        EvaluationScope &operator=(const EvaluationScope &) = delete;
    };

    /**
     * Suspends dependency collection for the lifetime of the scope.
     */
    struct REACTREE_EXPORT UntrackedScope : EvaluationScope {
        UntrackedScope() : EvaluationScope{nullptr} {}
    };
} // namespace reactree

#endif  // REACTREE_EVALUATION_STACK_H
