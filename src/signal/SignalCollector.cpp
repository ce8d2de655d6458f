#include "signal/SignalCollector.hpp"

#include <future>
#include <iostream>
#include <string>
#include <boost/asio/post.hpp>

using namespace tribunal;

SignalCollector::SignalCollector(CollectorProducers producers, std::size_t threads)
    : producers_(std::move(producers)),
      pool_(threads == 0 ? 1 : threads) {}

SignalCollector::~SignalCollector() {
    pool_.join();
}

std::vector<ProducerOutcome> SignalCollector::collect(const EvaluationInput& input,
                                                      const CollectorTimeouts& timeouts) {
    struct Slot {
        SignalSource                         source;
        std::shared_ptr<SignalProducer>      producer;
        std::chrono::milliseconds            timeout;
        std::future<ProducerOutcome>         result;
        std::chrono::steady_clock::time_point deadline;
    };

    std::vector<Slot> slots;
    slots.push_back({SignalSource::PATTERN,    producers_.pattern,    timeouts.producer,   {}, {}});
    slots.push_back({SignalSource::VISION,     producers_.vision,     timeouts.producer,   {}, {}});
    slots.push_back({SignalSource::CLASSIFIER, producers_.classifier, timeouts.classifier, {}, {}});

    // Task-owned copy: a producer that overruns its deadline may still be
    // reading the input after collect() has returned.
    auto shared_input = std::make_shared<const EvaluationInput>(input);
    auto start = std::chrono::steady_clock::now();

    for (auto& s : slots) {
        if (!s.producer) continue;

        auto promise = std::make_shared<std::promise<ProducerOutcome>>();
        s.result   = promise->get_future();
        s.deadline = start + s.timeout;

        // The producer gets what is left of its budget once a pool thread picks
        // it up; a task that waited out its whole budget in the queue never runs.
        boost::asio::post(pool_, [producer = s.producer, src = s.source, deadline = s.deadline,
                                  shared_input, promise]() {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) {
                promise->set_value(ProducerOutcome::failed(src, "timeout"));
                return;
            }
            try {
                promise->set_value(producer->produce(*shared_input, left));
            } catch (const std::exception& e) {
                promise->set_value(ProducerOutcome::failed(
                    src, std::string("producer threw: ") + e.what()));
            } catch (...) {
                promise->set_value(ProducerOutcome::failed(src, "producer threw non-standard exception"));
            }
        });
    }

    std::vector<ProducerOutcome> out;
    out.reserve(slots.size());

    for (auto& s : slots) {
        if (!s.producer) {
            out.push_back(ProducerOutcome::skipped(s.source));
            continue;
        }

        if (s.result.wait_until(s.deadline) != std::future_status::ready) {
            std::cerr << "[COLLECTOR] " << signalSourceToString(s.source)
                      << " producer timed out after " << s.timeout.count() << "ms\n";
            out.push_back(ProducerOutcome::failed(s.source, "timeout"));
            continue;
        }

        ProducerOutcome o = s.result.get();
        if (o.status == OutcomeStatus::SIGNAL &&
            (!o.signal || o.signal->source != s.source)) {
            std::cerr << "[COLLECTOR] " << signalSourceToString(s.source)
                      << " producer returned a signal for the wrong source\n";
            out.push_back(ProducerOutcome::failed(s.source, "signal source mismatch"));
            continue;
        }
        o.source = s.source;

        if (o.status == OutcomeStatus::ERROR) {
            std::cerr << "[COLLECTOR] " << signalSourceToString(s.source)
                      << " producer failed: " << o.error << "\n";
        }
        out.push_back(std::move(o));
    }
    return out;
}
