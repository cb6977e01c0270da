#pragma once

#include <atomic>
#include <optional>

// Vyukov MPSC (wait-free multiple producers, single consumer) queue
// https://www.1024cores.net/home/lock-free-algorithms/queues/intrusive-mpsc-node-based-queue
// Used by the log thread. T must be default constructible (for the stub node).
template <typename T>
class MpscQueue {
public:
    MpscQueue()
        : stub_()
        , consumeEnd_(&stub_)
        , produceEnd_(&stub_)
    {
    }

    ~MpscQueue()
    {
        while (consume()) { }
    }

    MpscQueue(const MpscQueue&) = delete;
    MpscQueue& operator=(const MpscQueue&) = delete;

    void produce(T&& value) { link(new Node { std::move(value), nullptr }); }

    // Might spuriously return nullopt while a producer is in the middle of linking a node.
    std::optional<T> consume()
    {
        auto node = consumeEnd_.load();
        auto next = node->next.load();

        if (node == &stub_) {
            if (!next) {
                return std::nullopt;
            }
            consumeEnd_.store(next);
            node = next;
            next = node->next.load();
        }

        if (next) {
            consumeEnd_.store(next);
            return unpack(node);
        }

        if (node != produceEnd_.load()) {
            return std::nullopt;
        }

        // node is the last element. Put the stub behind it, so node can be taken out.
        stub_.next.store(nullptr);
        link(&stub_);

        next = node->next.load();
        if (next) {
            consumeEnd_.store(next);
            return unpack(node);
        }

        return std::nullopt;
    }

private:
    struct Node {
        T value;
        std::atomic<Node*> next;
    };

    static T unpack(Node* node)
    {
        auto value = std::move(node->value);
        delete node;
        return value;
    }

    void link(Node* node)
    {
        auto prev = produceEnd_.exchange(node);
        prev->next.store(node);
    }

    Node stub_;
    std::atomic<Node*> consumeEnd_;
    std::atomic<Node*> produceEnd_;
};
