#pragma once

#include <cstddef>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "points/point.hpp"

namespace sim_points {

/**
 * @brief Owns every Point of the device, indexed by (kind, instance).
 *
 * Points are registered once at startup and never removed. References
 * returned by add()/find() stay valid for the registry's lifetime. Points are
 * internally synchronized, so the registry hands out mutable references from
 * const lookups; constness here covers membership only.
 *
 * Thread Safety:
 *   add()/find()/contains() are serialized by an internal mutex. Views from
 *   all()/all_of() must not be iterated concurrently with add(); the device
 *   finishes loading before the simulation ticker starts.
 */
class PointRegistry {
  using Storage = std::vector<std::unique_ptr<Point>>;

public:
  // Lazy, restartable view over registered points, optionally filtered by
  // kind, in registration order.
  class View {
  public:
    class iterator {
    public:
      using iterator_category = std::forward_iterator_tag;
      using value_type = Point;
      using difference_type = std::ptrdiff_t;
      using pointer = Point *;
      using reference = Point &;

      iterator(Storage::const_iterator it, Storage::const_iterator end,
               std::optional<PointKind> kind)
          : it_(it), end_(end), kind_(kind) {
        skip();
      }

      reference operator*() const { return **it_; }
      pointer operator->() const { return it_->get(); }

      iterator &operator++() {
        ++it_;
        skip();
        return *this;
      }
      iterator operator++(int) {
        iterator tmp = *this;
        ++(*this);
        return tmp;
      }

      bool operator==(const iterator &other) const { return it_ == other.it_; }
      bool operator!=(const iterator &other) const { return it_ != other.it_; }

    private:
      void skip() {
        while (kind_ && it_ != end_ && (*it_)->kind() != *kind_) {
          ++it_;
        }
      }

      Storage::const_iterator it_;
      Storage::const_iterator end_;
      std::optional<PointKind> kind_;
    };

    View(const Storage &storage, std::optional<PointKind> kind)
        : storage_(&storage), kind_(kind) {}

    iterator begin() const {
      return iterator(storage_->begin(), storage_->end(), kind_);
    }
    iterator end() const {
      return iterator(storage_->end(), storage_->end(), kind_);
    }
    bool empty() const { return begin() == end(); }

  private:
    const Storage *storage_;
    std::optional<PointKind> kind_;
  };

  PointRegistry() = default;

  PointRegistry(const PointRegistry &) = delete;
  PointRegistry &operator=(const PointRegistry &) = delete;

  /**
   * @brief Validate and register a point.
   *
   * @throws PointError InvalidDefinition for a malformed definition,
   *         DuplicateInstance if (kind, instance) is taken. On failure the
   *         registry is unchanged.
   */
  Point &add(PointDefinition def);

  // @throws PointError NotFound
  Point &find(PointKind kind, uint32_t instance) const;

  bool contains(PointKind kind, uint32_t instance) const;

  View all() const { return View(points_, std::nullopt); }
  View all_of(PointKind kind) const { return View(points_, kind); }

  std::size_t size() const;
  std::size_t count(PointKind kind) const;

  // Highest instance number used by any kind (0 when empty)
  uint32_t max_instance() const;

private:
  Storage points_;
  std::map<PointKey, Point *> index_;
  mutable std::mutex mutex_;
};

} // namespace sim_points
