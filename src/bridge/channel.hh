#pragma once

#include <atomic>
#include <chrono>
#include <concurrentqueue/blockingconcurrentqueue.h>
#include <optional>

#include "bridge_exception.hh"

/**
 * An inter-thread communication data structure, analogous to Go's channels.  Any number of threads may push;
 * items pushed by one thread are popped in the order that thread pushed them.
 *
 * Once closed, pushes throw ChannelClosed, and pops throw ChannelClosed after the remaining items are drained.
 */
template<typename T>
class Channel
{
  moodycamel::BlockingConcurrentQueue<std::optional<T>> data_ {};
  std::atomic<bool> shutdown_ = false;

  T unwrap( std::optional<T>&& item )
  {
    // an empty item is the sentinel enqueued by close(); items from other producers may still follow it
    while ( not item ) {
      if ( not data_.try_dequeue( item ) ) {
        data_.enqueue( std::nullopt );
        throw ChannelClosed();
      }
      if ( item ) {
        data_.enqueue( std::nullopt );
      }
    }
    return std::move( *item );
  }

public:
  Channel() {};

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
    std::optional<T> item;
    if ( data_.try_dequeue( item ) ) {
      return unwrap( std::move( item ) );
    }
    if ( shutdown_ ) {
      throw ChannelClosed();
    }
    return {};
  }

  T pop_or_wait()
  {
    std::optional<T> item;
    data_.wait_dequeue( item );
    return unwrap( std::move( item ) );
  }

  template<class Rep, class Period>
  std::optional<T> pop_for( std::chrono::duration<Rep, Period> timeout )
  {
    std::optional<T> item;
    if ( data_.wait_dequeue_timed( item, timeout ) ) {
      return unwrap( std::move( item ) );
    }
    if ( shutdown_ ) {
      throw ChannelClosed();
    }
    return {};
  }

  size_t size_approx() { return data_.size_approx(); }

  bool closed() const { return shutdown_; }

  void operator<<( T&& item ) { push( std::move( item ) ); }
  void operator>>( std::optional<T>& item ) { item = pop(); }
  void operator>>( T& item ) { item = pop_or_wait(); }

  void close()
  {
    if ( not shutdown_.exchange( true ) ) {
      data_.enqueue( std::nullopt );
    }
  }

  /* Closes the channel and destroys the items still queued, returning how many there were. */
  size_t drain()
  {
    close();
    size_t dropped = 0;
    std::optional<T> item;
    while ( data_.try_dequeue( item ) ) {
      if ( item ) {
        dropped++;
      }
      item.reset();
    }
    data_.enqueue( std::nullopt );
    return dropped;
  }

  ~Channel() { close(); }
};
