#ifndef BASE_EVENT_READER_HPP
#define BASE_EVENT_READER_HPP

#include "core/event.hpp"

#include <vector>

class IEventReader {
public:
  virtual ~IEventReader() = default;

  // Next batch of events; empty when nothing new is available
  virtual std::vector<EventPtr> get_next_batch() = 0;

  // True once the source can never yield more events
  virtual bool is_exhausted() const = 0;
};

#endif // BASE_EVENT_READER_HPP
