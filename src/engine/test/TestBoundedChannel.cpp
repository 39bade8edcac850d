#include <atomic>
#include <cassert>
#include <iostream>
#include <thread>
#include <vector>
#include "BoundedChannel.hpp"
#include "ThreadSafeQueue.hpp"

void test_fifo_and_close() {
    BoundedChannel<int> channel(4);
    assert(channel.push(1));
    assert(channel.push(2));
    channel.close();
    assert(!channel.push(3));

    auto first = channel.pop();
    assert(first.status == BoundedChannel<int>::PopStatus::Success && *first.data == 1);
    auto second = channel.pop();
    assert(second.status == BoundedChannel<int>::PopStatus::Success && *second.data == 2);
    auto end = channel.pop();
    (void)first;
    (void)second;
    (void)end;
    assert(end.status == BoundedChannel<int>::PopStatus::Closed);
    std::cout << "test_fifo_and_close passed\n";
}

void test_timeout() {
    BoundedChannel<int> channel(1, std::chrono::milliseconds(10));
    auto result = channel.pop();
    (void)result;
    assert(result.status == BoundedChannel<int>::PopStatus::Timeout);
    assert(!result.data);
    std::cout << "test_timeout passed\n";
}

void test_backpressure() {
    BoundedChannel<int> channel(2);
    std::atomic<int> pushed{0};
    std::thread producer([&] {
        for (int i = 0; i < 100; ++i) {
            if (!channel.push(i)) return;
            ++pushed;
        }
        channel.close();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    assert(pushed.load() <= 2);
    assert(channel.size() <= channel.capacity());

    std::vector<int> received;
    while (true) {
        auto result = channel.pop();
        if (result.status == BoundedChannel<int>::PopStatus::Closed) break;
        if (result.status == BoundedChannel<int>::PopStatus::Success) {
            received.push_back(*result.data);
        }
    }
    producer.join();
    assert(received.size() == 100);
    for (int i = 0; i < 100; ++i) {
        assert(received[i] == i);
    }
    std::cout << "test_backpressure passed\n";
}

void test_terminate_unblocks_producer() {
    BoundedChannel<int> channel(1);
    assert(channel.push(0));
    std::atomic<bool> returned{false};
    std::atomic<bool> accepted{true};
    std::thread producer([&] {
        accepted = channel.push(1);
        returned = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    assert(!returned.load());
    channel.terminate();
    producer.join();
    assert(returned.load());
    assert(!accepted.load());
    assert(channel.terminated());
    // Queued items are not delivered after termination
    assert(channel.pop().status == BoundedChannel<int>::PopStatus::Terminated);
    std::cout << "test_terminate_unblocks_producer passed\n";
}

void test_zero_capacity() {
    bool caught = false;
    try {
        BoundedChannel<int> channel(0);
    } catch (const std::invalid_argument&) {
        caught = true;
    }
    (void)caught;
    assert(caught);
    std::cout << "test_zero_capacity passed\n";
}

void test_job_queue() {
    ThreadSafeQueue<int> jobs;
    for (int i = 0; i < 50; ++i) jobs.enqueue(i);
    jobs.stop();
    assert(jobs.size() == 50);

    std::atomic<int> sum{0};
    std::vector<std::thread> workers;
    for (int w = 0; w < 4; ++w) {
        workers.emplace_back([&] {
            while (auto job = jobs.dequeue()) {
                sum += *job;
            }
        });
    }
    for (auto& t : workers) t.join();
    assert(sum.load() == 49 * 50 / 2);
    assert(!jobs.dequeue());

    ThreadSafeQueue<int> dropped;
    dropped.enqueue(1);
    dropped.clear();
    assert(!dropped.dequeue());
    std::cout << "test_job_queue passed\n";
}

int main() {
    test_fifo_and_close();
    test_timeout();
    test_backpressure();
    test_terminate_unblocks_producer();
    test_zero_capacity();
    test_job_queue();
    std::cout << "All BoundedChannel tests passed\n";
    return 0;
}
