#pragma once

#include <cstddef>
#include <functional>
#include <unordered_map>
#include <utility>
#include <vector>

// Indexed binary min-heap with decrease/increase-key.
//
// Each item may be present at most once. The item -> heap slot map is updated
// on every swap, so contains/priorityOf are O(1) and updatePriority is
// O(log n). Misuse is reported through return values:
//   - enqueue() of an item already present returns false
//   - updatePriority() of an absent item returns false
//   - dequeue() on an empty queue returns false
template <typename T, typename P = float, typename Hash = std::hash<T>, typename Eq = std::equal_to<T>>
class PriorityQueue {
public:
    bool enqueue(const T& item, P priority) {
        if (slot_.count(item)) return false;
        heap_.push_back({item, priority});
        const std::size_t i = heap_.size() - 1;
        slot_[item] = i;
        siftUp(i);
        return true;
    }

    bool dequeue(T& out) {
        if (heap_.empty()) return false;
        out = heap_.front().item;
        removeAt(0);
        return true;
    }

    bool contains(const T& item) const { return slot_.count(item) != 0; }

    bool priorityOf(const T& item, P& out) const {
        auto it = slot_.find(item);
        if (it == slot_.end()) return false;
        out = heap_[it->second].priority;
        return true;
    }

    bool updatePriority(const T& item, P priority) {
        auto it = slot_.find(item);
        if (it == slot_.end()) return false;
        const std::size_t i = it->second;
        const P old = heap_[i].priority;
        heap_[i].priority = priority;
        if (priority < old) siftUp(i);
        else siftDown(i);
        return true;
    }

    std::size_t size() const { return heap_.size(); }
    bool empty() const { return heap_.empty(); }

    void clear() {
        heap_.clear();
        slot_.clear();
    }

    // Heap shape plus index consistency; used by tests.
    bool valid() const {
        if (slot_.size() != heap_.size()) return false;
        for (std::size_t i = 0; i < heap_.size(); ++i) {
            auto it = slot_.find(heap_[i].item);
            if (it == slot_.end() || it->second != i) return false;
            if (i > 0 && heap_[i].priority < heap_[(i - 1) / 2].priority) return false;
        }
        return true;
    }

private:
    struct Entry {
        T item;
        P priority;
    };

    std::vector<Entry> heap_;
    std::unordered_map<T, std::size_t, Hash, Eq> slot_;

    void swapSlots(std::size_t a, std::size_t b) {
        std::swap(heap_[a], heap_[b]);
        slot_[heap_[a].item] = a;
        slot_[heap_[b].item] = b;
    }

    void siftUp(std::size_t i) {
        while (i > 0) {
            const std::size_t parent = (i - 1) / 2;
            if (!(heap_[i].priority < heap_[parent].priority)) break;
            swapSlots(i, parent);
            i = parent;
        }
    }

    void siftDown(std::size_t i) {
        const std::size_t n = heap_.size();
        for (;;) {
            const std::size_t l = 2 * i + 1;
            const std::size_t r = l + 1;
            std::size_t best = i;
            if (l < n && heap_[l].priority < heap_[best].priority) best = l;
            if (r < n && heap_[r].priority < heap_[best].priority) best = r;
            if (best == i) break;
            swapSlots(i, best);
            i = best;
        }
    }

    void removeAt(std::size_t i) {
        const std::size_t last = heap_.size() - 1;
        if (i != last) swapSlots(i, last);
        slot_.erase(heap_.back().item);
        heap_.pop_back();
        if (i < heap_.size()) {
            siftDown(i);
            siftUp(i);
        }
    }
};
