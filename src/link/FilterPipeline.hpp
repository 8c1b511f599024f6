#ifndef __BTLINK_FILTER_PIPELINE__
#define __BTLINK_FILTER_PIPELINE__

#include "Headers.hpp"
#include "MessageFilter.hpp"

namespace btlink {
/**
 * @brief The active set of filters, keyed by id.
 *
 * Incoming messages run through the filters in ascending priority and
 * outgoing ones in descending priority, so a priority 0 filter is the
 * outermost layer in both directions. A stage that throws is logged and
 * skipped (the message continues as it was before that stage), except for
 * ValidationError which reaches the caller.
 */
class FilterPipeline {
 public:
  FilterPipeline() {}

  /**
   * @brief Adds a filter, replacing any filter with the same id.
   * @return false if an existing filter was replaced.
   */
  bool addFilter(const MessageFilter& filter);
  bool removeFilter(const string& id);
  void clearFilters();
  bool hasFilter(const string& id) const;
  size_t size() const;

  /** @brief Active filters in ascending priority order. */
  vector<MessageFilter> activeFilters() const;

  /** @throws ValidationError if a Validation filter rejects the message. */
  Message applyIncoming(const Message& message) const;
  /** @throws ValidationError if a Validation filter rejects the message. */
  Message applyOutgoing(const Message& message) const;

 protected:
  mutable std::mutex filterMutex;
  map<string, MessageFilter> filters;
};
}  // namespace btlink

#endif  // __BTLINK_FILTER_PIPELINE__
