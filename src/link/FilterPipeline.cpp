#include "FilterPipeline.hpp"

namespace btlink {
bool FilterPipeline::addFilter(const MessageFilter& filter) {
  lock_guard<std::mutex> guard(filterMutex);
  bool inserted = filters.find(filter.getId()) == filters.end();
  filters.erase(filter.getId());
  filters.insert(make_pair(filter.getId(), filter));
  LOG(INFO) << (inserted ? "Added" : "Replaced") << " filter "
            << filter.getId() << " (" << filter.getTypeName()
            << ", priority " << filter.getPriority() << ")";
  return inserted;
}

bool FilterPipeline::removeFilter(const string& id) {
  lock_guard<std::mutex> guard(filterMutex);
  return filters.erase(id) > 0;
}

void FilterPipeline::clearFilters() {
  lock_guard<std::mutex> guard(filterMutex);
  filters.clear();
}

bool FilterPipeline::hasFilter(const string& id) const {
  lock_guard<std::mutex> guard(filterMutex);
  return filters.find(id) != filters.end();
}

size_t FilterPipeline::size() const {
  lock_guard<std::mutex> guard(filterMutex);
  return filters.size();
}

vector<MessageFilter> FilterPipeline::activeFilters() const {
  vector<MessageFilter> sorted;
  {
    lock_guard<std::mutex> guard(filterMutex);
    for (const auto& it : filters) {
      sorted.push_back(it.second);
    }
  }
  // filters is keyed by id, so equal priorities stay in id order
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const MessageFilter& a, const MessageFilter& b) {
                     return a.getPriority() < b.getPriority();
                   });
  return sorted;
}

Message FilterPipeline::applyIncoming(const Message& message) const {
  Message current(message);
  for (const auto& filter : activeFilters()) {
    try {
      current = filter.processIncoming(current);
    } catch (const ValidationError& ve) {
      LOG(WARNING) << "Filter " << filter.getId()
                   << " rejected incoming message: " << ve.what();
      throw;
    } catch (const std::exception& e) {
      LOG(ERROR) << "Filter " << filter.getId()
                 << " failed on incoming message, skipping it: " << e.what();
    }
  }
  return current;
}

Message FilterPipeline::applyOutgoing(const Message& message) const {
  Message current(message);
  auto sorted = activeFilters();
  for (auto it = sorted.rbegin(); it != sorted.rend(); ++it) {
    try {
      current = it->processOutgoing(current);
    } catch (const ValidationError& ve) {
      LOG(WARNING) << "Filter " << it->getId()
                   << " rejected outgoing message: " << ve.what();
      throw;
    } catch (const std::exception& e) {
      LOG(ERROR) << "Filter " << it->getId()
                 << " failed on outgoing message, skipping it: " << e.what();
    }
  }
  return current;
}
}  // namespace btlink
