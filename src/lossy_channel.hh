#pragma once

#include "datagram_channel.hh"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <thread>

// What the simulated channel does to each datagram sent through it
struct LossProfile
{
  double loss_rate = 0.0;      // probability a datagram vanishes
  double corrupt_rate = 0.0;   // probability 1-5 of its bytes are inverted
  double duplicate_rate = 0.0; // probability it is delivered twice
  uint64_t min_delay_ms = 0;   // each copy is held back a uniform random delay in [min, max]
  uint64_t max_delay_ms = 0;
  std::optional<uint32_t> seed {};
};

/*
 * Unreliable-channel simulator. Wraps another DatagramChannel and applies a LossProfile
 * on the sending side. Independent random delays let later datagrams overtake earlier
 * ones, which is how reordering arises. Delayed datagrams are released by a background
 * thread.
 */
class LossyChannel : public DatagramChannel
{
public:
  struct Statistics
  {
    uint64_t datagrams_sent {};
    uint64_t datagrams_lost {};
    uint64_t datagrams_corrupted {};
    uint64_t datagrams_duplicated {};
    uint64_t total_delay_ms {};
  };

  LossyChannel( std::shared_ptr<DatagramChannel> inner, const LossProfile& profile );
  ~LossyChannel() override;

  LossyChannel( const LossyChannel& other ) = delete;
  LossyChannel& operator=( const LossyChannel& other ) = delete;

  void send_datagram( const Address& destination, std::string payload ) override;
  std::optional<Datagram> receive_datagram( std::chrono::milliseconds timeout ) override;
  const Address& local_address() const override { return inner_->local_address(); }

  Statistics statistics() const;

private:
  using Clock = std::chrono::steady_clock;

  struct Pending
  {
    Address destination;
    std::string payload;
  };

  void corrupt( std::string& payload );
  void schedule( const Address& destination, std::string payload );
  void release_loop();

  std::shared_ptr<DatagramChannel> inner_;
  LossProfile profile_;

  mutable std::mutex mutex_ {};
  std::condition_variable wakeup_ {}; // new datagram scheduled, or stopping
  std::mt19937 rng_;                  // seeded from the profile, for reproducible runs

  std::multimap<Clock::time_point, Pending> pending_ {};
  // delayed datagrams by release time; equal times keep their send order

  Statistics stats_ {};
  bool stopping_ {};
  std::thread releaser_ {}; // hands due datagrams to inner_
};
