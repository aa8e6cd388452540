#include "lumen/gc.hpp"

#include <algorithm>
#include <utility>

#include "lumen/env.hpp"
#include "lumen/value.hpp"

namespace lumen {

gc::gc() = default;

gc::~gc() {
    gc_node* cursor = head_;
    while (cursor) {
        gc_node* next = cursor->next;
        delete cursor;
        cursor = next;
    }
}

void gc::link_node(gc_node* node, std::size_t bytes) {
    node->next = head_;
    head_ = node;

    ++allocated_objects_current_;
    ++total_allocated_objects_;
    bytes_allocated_ += bytes;

    if (allocated_objects_current_ > next_gc_threshold_) {
        collection_requested_ = true;
    }
}

void gc::maybe_collect() {
    if (collection_requested_) {
        collect();
    }
}

void gc::collect() {
    for (value* slot : root_slots_) {
        if (slot) {
            mark_value(*slot);
        }
    }
    for (env_ptr* slot : root_env_slots_) {
        if (slot) {
            mark_env(*slot);
        }
    }
    for (const std::vector<value>* items : root_vectors_) {
        if (items) {
            for (value item : *items) {
                mark_value(item);
            }
        }
    }
    for (env_ptr root : root_envs_) {
        mark_env(root);
    }
    mark_constants(*this);

    drain_mark_stack();
    sweep();
}

// Nodes are flagged when queued, so a cycle queues each node once.
void gc::mark_node(gc_node* node) {
    if (!node || node->marked) {
        return;
    }
    node->marked = true;
    mark_stack_.push_back(node);
}

void gc::drain_mark_stack() {
    while (!mark_stack_.empty()) {
        gc_node* node = mark_stack_.back();
        mark_stack_.pop_back();
        node->gc_mark_children(*this);
    }
}

void gc::mark_value(value v) {
    mark_node(v);
}

void gc::mark_env(env_ptr env) {
    mark_node(env);
}

void gc::sweep() {
    gc_node** link = &head_;
    std::size_t live_count = 0;
    std::size_t live_bytes = 0;

    while (*link) {
        gc_node* node = *link;
        if (!node->marked) {
            *link = node->next;
            delete node;
            continue;
        }

        node->marked = false;
        ++live_count;
        live_bytes += node->gc_size_bytes();
        link = &node->next;
    }

    allocated_objects_current_ = live_count;
    live_objects_after_last_gc_ = live_count;
    bytes_allocated_ = live_bytes;
    ++collections_;

    const std::size_t min_threshold = 256;
    const std::size_t grown = live_count * 2;
    next_gc_threshold_ = grown > min_threshold ? grown : min_threshold;

    collection_requested_ = false;
}

void gc::register_root_env(env_ptr env) {
    if (env) {
        root_envs_.push_back(env);
    }
}

void gc::unregister_root_env(env_ptr env) {
    const auto it = std::find(root_envs_.begin(), root_envs_.end(), env);
    if (it != root_envs_.end()) {
        root_envs_.erase(it);
    }
}

gc_stats_snapshot gc::stats() const noexcept {
    gc_stats_snapshot snapshot;
    snapshot.total_allocated_objects = total_allocated_objects_;
    snapshot.live_objects_after_last_gc = live_objects_after_last_gc_;
    snapshot.bytes_allocated = bytes_allocated_;
    snapshot.next_gc_threshold = next_gc_threshold_;
    snapshot.collections = collections_;
    return snapshot;
}

gc& default_gc() {
    static gc heap;
    return heap;
}

gc_root_scope::gc_root_scope(gc& heap)
    : heap_(heap),
      slots_begin_(heap.root_slots_.size()),
      env_slots_begin_(heap.root_env_slots_.size()),
      vectors_begin_(heap.root_vectors_.size()) {}

gc_root_scope::~gc_root_scope() {
    heap_.root_slots_.resize(slots_begin_);
    heap_.root_env_slots_.resize(env_slots_begin_);
    heap_.root_vectors_.resize(vectors_begin_);
}

void gc_root_scope::add(value* slot) {
    heap_.root_slots_.push_back(slot);
}

void gc_root_scope::add(env_ptr* slot) {
    heap_.root_env_slots_.push_back(slot);
}

void gc_root_scope::add(const std::vector<value>* items) {
    heap_.root_vectors_.push_back(items);
}

root_env_handle::root_env_handle(env_ptr env, gc& heap) : heap_(&heap), env_(env) {
    heap_->register_root_env(env_);
}

root_env_handle::~root_env_handle() {
    reset();
}

root_env_handle::root_env_handle(root_env_handle&& other) noexcept
    : heap_(std::exchange(other.heap_, nullptr)), env_(std::exchange(other.env_, nullptr)) {}

root_env_handle& root_env_handle::operator=(root_env_handle&& other) noexcept {
    if (this != &other) {
        reset();
        heap_ = std::exchange(other.heap_, nullptr);
        env_ = std::exchange(other.env_, nullptr);
    }
    return *this;
}

void root_env_handle::reset() noexcept {
    if (heap_ && env_) {
        heap_->unregister_root_env(env_);
    }
    heap_ = nullptr;
    env_ = nullptr;
}

}  // namespace lumen
