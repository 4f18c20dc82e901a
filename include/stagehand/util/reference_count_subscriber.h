#ifndef STAGEHAND_REFERENCE_COUNT_SUBSCRIBER_H
#define STAGEHAND_REFERENCE_COUNT_SUBSCRIBER_H

#include <cstddef>
#include <unordered_map>

namespace stagehand {

    /**
     * Counts how many times each key has been subscribed, so a resource shared by several subscribers is
     * acquired on the first subscription and released on the last.
     */
    template<typename T>
    class ReferenceCountSubscriber {
    public:
        /**
         * @return true when this is the first subscription for the key
         */
        bool subscribe(T subscriber);

        /**
         * @return true when this removed the last subscription for the key
         */
        bool un_subscribe(T subscriber);

        [[nodiscard]] std::size_t count(const T &subscriber) const {
            auto it{m_subscriptions.find(subscriber)};
            return it == m_subscriptions.end() ? 0 : it->second;
        }

        [[nodiscard]] bool empty() const { return m_subscriptions.empty(); }

        template<typename Op>
        void apply(Op op) const {
            for (const auto &[k, _]: m_subscriptions) { op(k); }
        }

        void clear() { m_subscriptions.clear(); }

    private:
        std::unordered_map<T, std::size_t> m_subscriptions{};
    };

    template<typename T>
    bool ReferenceCountSubscriber<T>::subscribe(T subscriber) {
        auto [it, success] = m_subscriptions.insert({subscriber, 1});
        if (!success) { ++(it->second); }
        return success;
    }

    template<typename T>
    bool ReferenceCountSubscriber<T>::un_subscribe(T subscriber) {
        auto it{m_subscriptions.find(subscriber)};
        if (it != m_subscriptions.end()) {
            if (--(it->second) == 0) {
                m_subscriptions.erase(it);
                return true;
            }
        }
        return false;
    }
}
#endif  // STAGEHAND_REFERENCE_COUNT_SUBSCRIBER_H
