#include <gtest/gtest.h>
#include "transfer_session.h"
#include "memory_transport.h"
#include "fs.h"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace peerdrop;
using namespace std::chrono_literals;

namespace {

const char* SCRATCH_DIR = "test_session_scratch";
const char* SOURCE_DIR = "test_session_scratch/outgoing";
const char* ALICE_DOWNLOADS = "test_session_scratch/alice";
const char* BOB_DOWNLOADS = "test_session_scratch/bob";

std::vector<uint8_t> make_pattern(size_t size, uint8_t seed = 0) {
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>((i * 31 + seed) % 251);
    }
    return data;
}

bool wait_until(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = 5000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(1ms);
    }
    return true;
}

size_t count_files(const std::string& directory) {
    if (!std::filesystem::exists(directory)) {
        return 0;
    }
    size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(directory)) {
        (void)entry;
        ++count;
    }
    return count;
}

/**
 * Collects every event a session publishes
 */
class EventRecorder {
public:
    void attach(FileTransferSession& session) {
        session.events().subscribe([this](const TransferEvent& event) {
            std::function<void(const TransferEvent&)> hook;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                events_.push_back(event);
                hook = hook_;
            }
            if (hook) {
                hook(event);
            }
        });
    }

    // Runs on the publishing thread after the event is recorded
    void set_hook(std::function<void(const TransferEvent&)> hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        hook_ = std::move(hook);
    }

    std::vector<TransferEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    size_t count_state(SessionState state) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        for (const auto& event : events_) {
            if (event.type == TransferEventType::STATE_CHANGED && event.state == state) {
                ++count;
            }
        }
        return count;
    }

    bool wait_for_state(SessionState state, size_t occurrences = 1, std::chrono::milliseconds timeout = 5000ms) const {
        return wait_until([&]() { return count_state(state) >= occurrences; }, timeout);
    }

    // Last transition into the given state
    TransferEvent last_transition_to(SessionState state) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
            if (it->type == TransferEventType::STATE_CHANGED && it->state == state) {
                return *it;
            }
        }
        return TransferEvent();
    }

private:
    mutable std::mutex mutex_;
    std::vector<TransferEvent> events_;
    std::function<void(const TransferEvent&)> hook_;
};

void expect_error(const std::function<void()>& operation, TransferErrorCode code) {
    try {
        operation();
        ADD_FAILURE() << "Expected " << transfer_error_code_to_string(code);
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), code) << e.what();
    }
}

} // namespace

class TransferSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::filesystem::remove_all(SCRATCH_DIR);
        ASSERT_TRUE(create_directories(SOURCE_DIR));

        alice_config_.download_directory = ALICE_DOWNLOADS;
        alice_config_.backpressure_poll_ms = 1;
        bob_config_.download_directory = BOB_DOWNLOADS;
        bob_config_.backpressure_poll_ms = 1;
    }

    void TearDown() override {
        alice_.reset();
        bob_.reset();
        alice_transport_.reset();
        bob_transport_.reset();
        std::filesystem::remove_all(SCRATCH_DIR);
    }

    void create_sessions(bool text_as_binary = false) {
        auto pair = MemoryPeerTransport::create_pair(text_as_binary);
        alice_transport_ = pair.first;
        bob_transport_ = pair.second;
        alice_.reset(new FileTransferSession(alice_transport_, nullptr, alice_config_));
        bob_.reset(new FileTransferSession(bob_transport_, nullptr, bob_config_));
        alice_events_.attach(*alice_);
        bob_events_.attach(*bob_);
    }

    // Alice offers, Bob answers, both wait for the channel
    void connect(bool text_as_binary = false) {
        create_sessions(text_as_binary);

        alice_->start(PeerRole::INITIATOR);
        alice_->apply_local_description(alice_->get_local_description());
        bob_->start(PeerRole::RESPONDER);
        bob_->apply_remote_description(alice_->get_local_description());
        alice_->apply_remote_description(bob_->get_local_description());

        ASSERT_TRUE(wait_until([this]() {
            return alice_->get_state() == SessionState::CHANNEL_OPEN &&
                   bob_->get_state() == SessionState::CHANNEL_OPEN;
        }));
    }

    std::string write_source(const std::string& name, const std::vector<uint8_t>& data) {
        std::string path = combine_paths(SOURCE_DIR, name);
        EXPECT_TRUE(create_file_binary(path.c_str(), data.data(), data.size()));
        return path;
    }

    std::vector<uint8_t> read_back(const std::string& path) {
        DiskChunkIO io(SCRATCH_DIR);
        return io.read_file_chunk(path, 0, static_cast<size_t>(get_file_size(path)) + 1);
    }

    std::shared_ptr<MemoryChannel> alice_channel() { return alice_transport_->memory_channel(); }

    TransferConfig alice_config_;
    TransferConfig bob_config_;
    EventRecorder alice_events_;
    EventRecorder bob_events_;
    std::shared_ptr<MemoryPeerTransport> alice_transport_;
    std::shared_ptr<MemoryPeerTransport> bob_transport_;
    std::unique_ptr<FileTransferSession> alice_;
    std::unique_ptr<FileTransferSession> bob_;
};

//=============================================================================
// Negotiation
//=============================================================================

TEST_F(TransferSessionTest, OperationsOutOfOrderAreRejected) {
    create_sessions();

    EXPECT_EQ(alice_->get_state(), SessionState::IDLE);
    expect_error([this]() { alice_->begin_send("whatever.bin"); }, TransferErrorCode::NOT_CONNECTED);
    expect_error([this]() { alice_->apply_remote_description("{}"); }, TransferErrorCode::INVALID_STATE);
    expect_error([this]() { alice_->apply_local_description("{}"); }, TransferErrorCode::INVALID_STATE);
    alice_->cancel();
    EXPECT_EQ(alice_->get_state(), SessionState::IDLE);

    alice_->start(PeerRole::INITIATOR);
    EXPECT_EQ(alice_->get_state(), SessionState::AWAITING_LOCAL_DESCRIPTION);
    EXPECT_EQ(alice_->get_role(), PeerRole::INITIATOR);
    expect_error([this]() { alice_->start(PeerRole::INITIATOR); }, TransferErrorCode::INVALID_STATE);
    expect_error([this]() { alice_->begin_send("whatever.bin"); }, TransferErrorCode::NOT_CONNECTED);

    // The answer cannot arrive before the offer has been handed out
    std::string offer = alice_->get_local_description();
    ASSERT_FALSE(offer.empty());
    expect_error([&]() { alice_->apply_remote_description(offer); }, TransferErrorCode::INVALID_STATE);
    EXPECT_EQ(alice_->get_state(), SessionState::AWAITING_LOCAL_DESCRIPTION);

    alice_->apply_local_description(offer);
    EXPECT_EQ(alice_->get_state(), SessionState::AWAITING_REMOTE_DESCRIPTION);

    // Malformed input is reported without changing state
    expect_error([this]() { alice_->apply_remote_description("not json at all"); }, TransferErrorCode::SIGNAL_PARSE);
    // Pasting our own offer back
    expect_error([&]() { alice_->apply_remote_description(offer); }, TransferErrorCode::INVALID_STATE);
    EXPECT_EQ(alice_->get_state(), SessionState::AWAITING_REMOTE_DESCRIPTION);
}

TEST_F(TransferSessionTest, InitiatorPublishesOfferBeforeWaiting) {
    create_sessions();
    alice_->start(PeerRole::INITIATOR);

    std::vector<TransferEvent> events = alice_events_.events();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].type, TransferEventType::STATE_CHANGED);
    EXPECT_EQ(events[0].state, SessionState::AWAITING_LOCAL_DESCRIPTION);
    EXPECT_EQ(events[1].type, TransferEventType::LOCAL_DESCRIPTION);
    EXPECT_EQ(events[1].state, SessionState::AWAITING_LOCAL_DESCRIPTION);
    EXPECT_EQ(events[1].message, alice_->get_local_description());

    alice_->apply_local_description(events[1].message);
    events = alice_events_.events();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[2].type, TransferEventType::STATE_CHANGED);
    EXPECT_EQ(events[2].previous_state, SessionState::AWAITING_LOCAL_DESCRIPTION);
    EXPECT_EQ(events[2].state, SessionState::AWAITING_REMOTE_DESCRIPTION);

    // Committed once
    expect_error([&]() { alice_->apply_local_description(events[1].message); }, TransferErrorCode::INVALID_STATE);
    EXPECT_EQ(alice_events_.events().size(), 3u);
}

TEST_F(TransferSessionTest, OnlyTheGeneratedOfferCanBeCommitted) {
    create_sessions();
    auto other_pair = MemoryPeerTransport::create_pair();
    FileTransferSession stranger(other_pair.first, nullptr, alice_config_);
    stranger.start(PeerRole::INITIATOR);

    alice_->start(PeerRole::INITIATOR);
    expect_error([this]() { alice_->apply_local_description("{\"type\":\"offer\"}"); },
                 TransferErrorCode::SIGNAL_PARSE);
    expect_error([&]() { alice_->apply_local_description(stranger.get_local_description()); },
                 TransferErrorCode::INVALID_STATE);
    EXPECT_EQ(alice_->get_state(), SessionState::AWAITING_LOCAL_DESCRIPTION);

    // A responder's answer is committed as it is generated
    bob_->events().subscribe([this](const TransferEvent& event) {
        if (event.type == TransferEventType::LOCAL_DESCRIPTION) {
            expect_error([&]() { bob_->apply_local_description(event.message); }, TransferErrorCode::INVALID_STATE);
        }
    });
    bob_->start(PeerRole::RESPONDER);
    bob_->apply_remote_description(alice_->get_local_description());
    EXPECT_EQ(bob_->get_state(), SessionState::AWAITING_REMOTE_DESCRIPTION);
}

TEST_F(TransferSessionTest, ResponderAnswersAndBothSidesOpen) {
    connect();

    EXPECT_TRUE(alice_->is_channel_open());
    EXPECT_TRUE(bob_->is_channel_open());
    EXPECT_EQ(bob_->get_role(), PeerRole::RESPONDER);

    std::vector<TransferEvent> events = bob_events_.events();
    ASSERT_GE(events.size(), 3u);
    EXPECT_EQ(events[0].state, SessionState::AWAITING_REMOTE_DESCRIPTION);
    EXPECT_EQ(events[1].type, TransferEventType::LOCAL_DESCRIPTION);
    EXPECT_EQ(events[1].message, bob_->get_local_description());
    EXPECT_EQ(bob_events_.last_transition_to(SessionState::CHANNEL_OPEN).previous_state,
              SessionState::AWAITING_REMOTE_DESCRIPTION);

    // A second description is refused once negotiated
    expect_error([this]() { bob_->apply_remote_description(alice_->get_local_description()); },
                 TransferErrorCode::INVALID_STATE);
}

TEST_F(TransferSessionTest, CredentialMismatchFailsTheSession) {
    create_sessions();

    // Bob answers an offer that came from an unrelated session
    auto other_pair = MemoryPeerTransport::create_pair();
    FileTransferSession stranger(other_pair.first, nullptr, alice_config_);
    stranger.start(PeerRole::INITIATOR);

    alice_->start(PeerRole::INITIATOR);
    alice_->apply_local_description(alice_->get_local_description());
    bob_->start(PeerRole::RESPONDER);
    bob_->apply_remote_description(stranger.get_local_description());
    alice_->apply_remote_description(bob_->get_local_description());

    ASSERT_TRUE(alice_events_.wait_for_state(SessionState::ERRORED));
    ASSERT_TRUE(bob_events_.wait_for_state(SessionState::ERRORED));

    TransferEvent failure = alice_events_.last_transition_to(SessionState::ERRORED);
    EXPECT_TRUE(failure.has_error);
    EXPECT_EQ(failure.error_code, TransferErrorCode::TRANSPORT_ERROR);
    EXPECT_EQ(failure.message.compare(0, 16, "Connection lost:"), 0) << failure.message;
    EXPECT_EQ(alice_events_.count_state(SessionState::CHANNEL_OPEN), 0u);

    expect_error([this]() { alice_->begin_send("whatever.bin"); }, TransferErrorCode::NOT_CONNECTED);
    expect_error([this]() { alice_->apply_remote_description(bob_->get_local_description()); },
                 TransferErrorCode::INVALID_STATE);
}

//=============================================================================
// Transfers
//=============================================================================

TEST_F(TransferSessionTest, TransfersFileEndToEnd) {
    connect();
    std::vector<uint8_t> data = make_pattern(200000);
    std::string path = write_source("report.pdf", data);

    alice_->begin_send(path);
    ASSERT_TRUE(alice_events_.wait_for_state(SessionState::COMPLETED));
    ASSERT_TRUE(bob_events_.wait_for_state(SessionState::COMPLETED));

    TransferEvent received = bob_events_.last_transition_to(SessionState::COMPLETED);
    ASSERT_TRUE(received.has_progress);
    EXPECT_FALSE(received.has_error);
    EXPECT_EQ(received.progress.direction, TransferDirection::RECEIVE);
    EXPECT_EQ(received.progress.file_name, "report.pdf");
    EXPECT_EQ(received.progress.bytes_transferred, 200000u);
    EXPECT_DOUBLE_EQ(received.progress.percentage, 100.0);
    EXPECT_EQ(received.progress.saved_path, combine_paths(BOB_DOWNLOADS, "report.pdf"));
    EXPECT_EQ(read_back(received.progress.saved_path), data);

    TransferEvent sent = alice_events_.last_transition_to(SessionState::COMPLETED);
    ASSERT_TRUE(sent.has_progress);
    EXPECT_EQ(sent.progress.direction, TransferDirection::SEND);
    EXPECT_EQ(sent.progress.bytes_transferred, 200000u);

    // Both sides are ready for another transfer
    ASSERT_TRUE(wait_until([this]() {
        return alice_->get_state() == SessionState::CHANNEL_OPEN && bob_->get_state() == SessionState::CHANNEL_OPEN;
    }));
    EXPECT_EQ(bob_->get_progress().saved_path, received.progress.saved_path);
}

TEST_F(TransferSessionTest, EventsAreOrderedAndProgressIsMonotonic) {
    connect();
    std::string path = write_source("ordered.bin", make_pattern(5 * CHUNK_SIZE + 100));
    alice_->begin_send(path);
    ASSERT_TRUE(bob_events_.wait_for_state(SessionState::COMPLETED));
    ASSERT_TRUE(alice_events_.wait_for_state(SessionState::COMPLETED));

    for (const EventRecorder* recorder : {&alice_events_, &bob_events_}) {
        std::vector<TransferEvent> events = recorder->events();
        uint64_t bytes = 0;
        for (size_t i = 0; i < events.size(); ++i) {
            EXPECT_EQ(events[i].sequence, i + 1);
            if (events[i].type == TransferEventType::PROGRESS) {
                EXPECT_GE(events[i].progress.bytes_transferred, bytes);
                EXPECT_LE(events[i].progress.bytes_transferred, events[i].progress.file_size);
                bytes = events[i].progress.bytes_transferred;
            }
        }
    }

    // Receiver sees one progress event per chunk
    size_t progress_events = 0;
    for (const auto& event : bob_events_.events()) {
        if (event.type == TransferEventType::PROGRESS) {
            ++progress_events;
        }
    }
    EXPECT_EQ(progress_events, 6u);
}

TEST_F(TransferSessionTest, SequentialTransfersInBothDirections) {
    connect();
    std::vector<uint8_t> first = make_pattern(70000, 1);
    std::vector<uint8_t> second = make_pattern(1000, 2);
    std::string first_path = write_source("notes.txt", first);

    alice_->begin_send(first_path);
    ASSERT_TRUE(bob_events_.wait_for_state(SessionState::COMPLETED, 1));
    ASSERT_TRUE(alice_events_.wait_for_state(SessionState::COMPLETED, 1));
    ASSERT_TRUE(wait_until([this]() { return bob_->get_state() == SessionState::CHANNEL_OPEN; }));

    std::string second_path = write_source("reply.bin", second);
    bob_->begin_send(second_path);
    ASSERT_TRUE(alice_events_.wait_for_state(SessionState::COMPLETED, 2));
    ASSERT_TRUE(bob_events_.wait_for_state(SessionState::COMPLETED, 2));
    EXPECT_EQ(read_back(combine_paths(ALICE_DOWNLOADS, "reply.bin")), second);

    // Same name again gets a numbered copy
    ASSERT_TRUE(wait_until([this]() { return alice_->get_state() == SessionState::CHANNEL_OPEN; }));
    alice_->begin_send(first_path);
    ASSERT_TRUE(bob_events_.wait_for_state(SessionState::COMPLETED, 3));
    EXPECT_EQ(bob_events_.last_transition_to(SessionState::COMPLETED).progress.saved_path,
              combine_paths(BOB_DOWNLOADS, "notes (1).txt"));
    EXPECT_EQ(read_back(combine_paths(BOB_DOWNLOADS, "notes.txt")), first);
    EXPECT_EQ(read_back(combine_paths(BOB_DOWNLOADS, "notes (1).txt")), first);
}

TEST_F(TransferSessionTest, NextSendStartedFromCompletionCallbackIsJoinedOnDestroy) {
    connect();
    std::vector<uint8_t> first = make_pattern(3 * CHUNK_SIZE + 17, 3);
    std::vector<uint8_t> second = make_pattern(CHUNK_SIZE + 5, 4);
    std::string first_path = write_source("a.bin", first);
    std::string second_path = write_source("b.bin", second);

    std::atomic<int> completions{0};
    alice_events_.set_hook([&](const TransferEvent& event) {
        if (event.type != TransferEventType::STATE_CHANGED || event.state != SessionState::COMPLETED) {
            return;
        }
        if (++completions == 1) {
            alice_->begin_send(second_path);
        } else {
            // Still dispatching when the session is destroyed
            std::this_thread::sleep_for(50ms);
        }
    });

    alice_->begin_send(first_path);
    ASSERT_TRUE(bob_events_.wait_for_state(SessionState::COMPLETED, 2));
    ASSERT_TRUE(alice_events_.wait_for_state(SessionState::COMPLETED, 2));
    EXPECT_EQ(read_back(combine_paths(BOB_DOWNLOADS, "a.bin")), first);
    EXPECT_EQ(read_back(combine_paths(BOB_DOWNLOADS, "b.bin")), second);

    alice_.reset();
    EXPECT_EQ(completions.load(), 2);
}

TEST_F(TransferSessionTest, CloseFromCompletionCallbackThenDestroy) {
    connect();
    std::string path = write_source("once.bin", make_pattern(CHUNK_SIZE + 1));

    std::atomic<bool> closed{false};
    alice_events_.set_hook([&](const TransferEvent& event) {
        if (event.type == TransferEventType::STATE_CHANGED && event.state == SessionState::COMPLETED) {
            alice_->close();
            closed = true;
        }
    });

    alice_->begin_send(path);
    ASSERT_TRUE(wait_until([&]() { return closed.load(); }));
    EXPECT_FALSE(alice_channel()->is_open());
    alice_.reset();

    ASSERT_TRUE(bob_events_.wait_for_state(SessionState::COMPLETED));
    EXPECT_EQ(get_file_size(combine_paths(BOB_DOWNLOADS, "once.bin")), static_cast<int64_t>(CHUNK_SIZE + 1));
}

TEST_F(TransferSessionTest, EmptyFileTransfers) {
    connect();
    std::string path = write_source("empty.dat", {});
    alice_->begin_send(path);

    ASSERT_TRUE(bob_events_.wait_for_state(SessionState::COMPLETED));
    TransferEvent received = bob_events_.last_transition_to(SessionState::COMPLETED);
    EXPECT_EQ(received.progress.file_size, 0u);
    EXPECT_DOUBLE_EQ(received.progress.percentage, 100.0);
    EXPECT_TRUE(file_exists(received.progress.saved_path));
    EXPECT_EQ(get_file_size(received.progress.saved_path), 0);
}

TEST_F(TransferSessionTest, TextDeliveredAsBinaryStillTransfers) {
    connect(true);
    std::vector<uint8_t> data = make_pattern(2 * CHUNK_SIZE + 7);
    std::string path = write_source("mixed.bin", data);

    alice_->begin_send(path);
    ASSERT_TRUE(bob_events_.wait_for_state(SessionState::COMPLETED));
    EXPECT_EQ(bob_events_.count_state(SessionState::ERRORED), 0u);
    EXPECT_EQ(read_back(combine_paths(BOB_DOWNLOADS, "mixed.bin")), data);
}

TEST_F(TransferSessionTest, MissingSourceFileEndsTransferWithError) {
    connect();
    alice_->begin_send(combine_paths(SOURCE_DIR, "does_not_exist.bin"));

    ASSERT_TRUE(alice_events_.wait_for_state(SessionState::ERRORED));
    TransferEvent failure = alice_events_.last_transition_to(SessionState::ERRORED);
    EXPECT_TRUE(failure.has_error);
    EXPECT_EQ(failure.error_code, TransferErrorCode::IO_ERROR);

    // The channel survives a failed transfer
    ASSERT_TRUE(wait_until([this]() { return alice_->get_state() == SessionState::CHANNEL_OPEN; }));
    EXPECT_EQ(bob_events_.count_state(SessionState::TRANSFERRING), 0u);
}

//=============================================================================
// Backpressure, cancellation and teardown
//=============================================================================

TEST_F(TransferSessionTest, SendStopsAtHighWaterMarkUntilPeerDrains) {
    connect();
    std::vector<uint8_t> data = make_pattern(10 * CHUNK_SIZE);
    std::string path = write_source("large.bin", data);
    size_t metadata_size = encode_control_message(ControlMessage::metadata("large.bin", data.size())).size();

    alice_channel()->set_delivery_paused(true);
    alice_->begin_send(path);

    size_t expected = metadata_size + 4 * CHUNK_SIZE;
    ASSERT_TRUE(wait_until([&]() { return alice_channel()->buffered_amount() == expected; }));
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(alice_channel()->buffered_amount(), expected);
    EXPECT_EQ(alice_->get_state(), SessionState::TRANSFERRING);
    EXPECT_EQ(bob_events_.count_state(SessionState::TRANSFERRING), 0u);
    expect_error([&]() { alice_->begin_send(path); }, TransferErrorCode::TRANSFER_IN_PROGRESS);

    alice_channel()->set_delivery_paused(false);
    ASSERT_TRUE(bob_events_.wait_for_state(SessionState::COMPLETED));
    ASSERT_TRUE(alice_events_.wait_for_state(SessionState::COMPLETED));
    EXPECT_EQ(read_back(combine_paths(BOB_DOWNLOADS, "large.bin")), data);
}

TEST_F(TransferSessionTest, ReceiverCancelLeavesNoFile) {
    connect();
    std::string path = write_source("movie.mkv", make_pattern(20 * CHUNK_SIZE));

    // Hold the sender once the receiver has taken the first chunk
    std::atomic<bool> first_chunk{false};
    bob_events_.set_hook([&](const TransferEvent& event) {
        if (event.type == TransferEventType::PROGRESS && !first_chunk.exchange(true)) {
            alice_channel()->set_delivery_paused(true);
        }
    });

    alice_->begin_send(path);
    ASSERT_TRUE(wait_until([&]() { return first_chunk.load(); }));
    EXPECT_EQ(bob_->get_state(), SessionState::TRANSFERRING);

    bob_->cancel();
    EXPECT_EQ(bob_->get_state(), SessionState::CHANNEL_OPEN);
    ASSERT_TRUE(bob_events_.wait_for_state(SessionState::CANCELLED));
    EXPECT_EQ(count_files(BOB_DOWNLOADS), 0u);

    TransferEvent cancelled = bob_events_.last_transition_to(SessionState::CANCELLED);
    EXPECT_TRUE(cancelled.has_error);
    EXPECT_EQ(cancelled.error_code, TransferErrorCode::TRANSFER_CANCELLED);

    // The sender hears about it and stops
    ASSERT_TRUE(alice_events_.wait_for_state(SessionState::CANCELLED));
    EXPECT_EQ(alice_events_.last_transition_to(SessionState::CANCELLED).progress.error, "Transfer cancelled by peer");

    // Frames still in flight are dropped, not treated as a new transfer
    alice_channel()->set_delivery_paused(false);
    ASSERT_TRUE(wait_until([this]() { return alice_channel()->buffered_amount() == 0; }));
    EXPECT_EQ(bob_events_.count_state(SessionState::ERRORED), 0u);
    EXPECT_EQ(bob_events_.count_state(SessionState::TRANSFERRING), 1u);
    EXPECT_EQ(count_files(BOB_DOWNLOADS), 0u);

    // And the channel carries the next file
    bob_events_.set_hook(nullptr);
    std::vector<uint8_t> data = make_pattern(3000);
    ASSERT_TRUE(wait_until([this]() { return alice_->get_state() == SessionState::CHANNEL_OPEN; }));
    alice_->begin_send(write_source("next.bin", data));
    ASSERT_TRUE(bob_events_.wait_for_state(SessionState::COMPLETED));
    EXPECT_EQ(read_back(combine_paths(BOB_DOWNLOADS, "next.bin")), data);
}

TEST_F(TransferSessionTest, SenderCancelStopsReceiver) {
    connect();
    std::string path = write_source("backup.tar", make_pattern(20 * CHUNK_SIZE));

    alice_channel()->set_delivery_paused(true);
    alice_->begin_send(path);
    ASSERT_TRUE(wait_until([this]() { return alice_channel()->buffered_amount() > HIGH_WATER_MARK; }));

    alice_->cancel();
    ASSERT_TRUE(alice_events_.wait_for_state(SessionState::CANCELLED));
    TransferEvent cancelled = alice_events_.last_transition_to(SessionState::CANCELLED);
    EXPECT_EQ(cancelled.error_code, TransferErrorCode::TRANSFER_CANCELLED);
    EXPECT_EQ(cancelled.progress.direction, TransferDirection::SEND);

    alice_channel()->set_delivery_paused(false);
    ASSERT_TRUE(bob_events_.wait_for_state(SessionState::CANCELLED));
    EXPECT_EQ(bob_events_.last_transition_to(SessionState::CANCELLED).progress.error, "Transfer cancelled by peer");
    EXPECT_EQ(count_files(BOB_DOWNLOADS), 0u);
    ASSERT_TRUE(wait_until([this]() { return bob_->get_state() == SessionState::CHANNEL_OPEN; }));
}

TEST_F(TransferSessionTest, CloseDuringReceiveCancelsThePeer) {
    connect();
    std::string path = write_source("archive.zip", make_pattern(20 * CHUNK_SIZE));

    std::atomic<bool> first_chunk{false};
    bob_events_.set_hook([&](const TransferEvent& event) {
        if (event.type == TransferEventType::PROGRESS && !first_chunk.exchange(true)) {
            alice_channel()->set_delivery_paused(true);
        }
    });

    alice_->begin_send(path);
    ASSERT_TRUE(wait_until([&]() { return first_chunk.load(); }));

    size_t bob_events_before = bob_events_.events().size();
    bob_->close();
    EXPECT_EQ(bob_events_.events().size(), bob_events_before);
    EXPECT_EQ(count_files(BOB_DOWNLOADS), 0u);

    // The sender stops; depending on timing it sees the cancel or the lost connection last
    ASSERT_TRUE(alice_events_.wait_for_state(SessionState::ERRORED));
    ASSERT_TRUE(wait_until([this]() { return !alice_->is_channel_open(); }));
    EXPECT_EQ(alice_events_.count_state(SessionState::COMPLETED), 0u);
    EXPECT_EQ(alice_->get_state(), SessionState::ERRORED);

    // Closing twice is harmless
    bob_->close();
    expect_error([this]() { bob_->begin_send("whatever.bin"); }, TransferErrorCode::NOT_CONNECTED);
}

TEST_F(TransferSessionTest, PeerDisconnectDuringSendIsAnError) {
    connect();
    std::string path = write_source("disk.img", make_pattern(20 * CHUNK_SIZE));

    alice_channel()->set_delivery_paused(true);
    alice_->begin_send(path);
    ASSERT_TRUE(wait_until([this]() { return alice_channel()->buffered_amount() > HIGH_WATER_MARK; }));

    bob_transport_->close();

    ASSERT_TRUE(alice_events_.wait_for_state(SessionState::ERRORED));
    TransferEvent failure = alice_events_.last_transition_to(SessionState::ERRORED);
    EXPECT_EQ(failure.error_code, TransferErrorCode::TRANSPORT_ERROR);
    ASSERT_TRUE(failure.has_progress);
    EXPECT_EQ(failure.progress.direction, TransferDirection::SEND);
    EXPECT_LT(failure.progress.bytes_transferred, failure.progress.file_size);

    // ERRORED after a lost connection is final
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(alice_->get_state(), SessionState::ERRORED);
    expect_error([&]() { alice_->begin_send(path); }, TransferErrorCode::NOT_CONNECTED);
}

TEST_F(TransferSessionTest, SimultaneousSendsCancelEachOther) {
    connect();
    std::string alice_path = write_source("from_alice.bin", make_pattern(10 * CHUNK_SIZE, 3));
    std::string bob_path = write_source("from_bob.bin", make_pattern(10 * CHUNK_SIZE, 4));
    std::shared_ptr<MemoryChannel> bob_channel = bob_transport_->memory_channel();

    alice_channel()->set_delivery_paused(true);
    bob_channel->set_delivery_paused(true);
    alice_->begin_send(alice_path);
    bob_->begin_send(bob_path);
    ASSERT_TRUE(wait_until([&]() { return bob_channel->buffered_amount() > HIGH_WATER_MARK; }));

    // Bob sees Alice's metadata while his own send is running
    alice_channel()->set_delivery_paused(false);
    ASSERT_TRUE(bob_events_.wait_for_state(SessionState::CANCELLED));
    EXPECT_EQ(bob_events_.last_transition_to(SessionState::CANCELLED).progress.direction, TransferDirection::SEND);

    bob_channel->set_delivery_paused(false);
    ASSERT_TRUE(wait_until([&]() {
        return alice_->get_state() == SessionState::CHANNEL_OPEN && bob_->get_state() == SessionState::CHANNEL_OPEN &&
               alice_channel()->buffered_amount() == 0 && bob_channel->buffered_amount() == 0;
    }));
    EXPECT_EQ(count_files(BOB_DOWNLOADS), 0u);
    EXPECT_EQ(count_files(ALICE_DOWNLOADS), 0u);
    EXPECT_EQ(bob_events_.count_state(SessionState::ERRORED), 0u);
}

TEST_F(TransferSessionTest, RejectsTransportWithoutChannel) {
    expect_error([]() { FileTransferSession session(nullptr, nullptr); }, TransferErrorCode::TRANSPORT_ERROR);
}
