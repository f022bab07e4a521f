#pragma once

#include <atomic>
#include <exception>
#include <optional>

#include <concurrentqueue/blockingconcurrentqueue.h>

class ChannelClosed : public std::exception
{
public:
  const char* what() const noexcept override { return "Channel was closed."; }
};

/**
 * An inter-thread communication data structure, analogous to Go's channels.
 *
 * Items are moved through the channel, so move-only types are supported. A default-constructed T is used as the
 * wake-up marker on close().
 */
template<typename T>
class Channel
{
  moodycamel::BlockingConcurrentQueue<T> data_ {};
  std::atomic<bool> shutdown_ = false;

public:
  Channel() {}

  Channel( const Channel& ) = delete;
  Channel& operator=( const Channel& ) = delete;

  void push( T&& item )
  {
    if ( shutdown_ ) {
      throw ChannelClosed {};
    }
    data_.enqueue( std::move( item ) );
  }

  std::optional<T> pop()
  {
    if ( shutdown_ ) {
      throw ChannelClosed();
    }
    T item;
    if ( data_.try_dequeue( item ) ) {
      return item;
    }
    return {};
  }

  T pop_or_wait()
  {
    T item;
    data_.wait_dequeue( item );
    if ( shutdown_ ) {
      // Hand the marker on so every blocked reader wakes up.
      data_.enqueue( std::move( item ) );
      throw ChannelClosed();
    }
    return item;
  }

  size_t size_approx() const { return data_.size_approx(); }

  bool closed() const { return shutdown_; }

  void operator<<( T&& item ) { push( std::move( item ) ); }
  void operator>>( std::optional<T>& item ) { item = pop(); }
  void operator>>( T& item ) { item = pop_or_wait(); }

  void close()
  {
    if ( shutdown_.exchange( true ) ) {
      return;
    }
    data_.enqueue( T() );
  }

  ~Channel() { close(); }
};
