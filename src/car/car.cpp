// src/car/car.cpp
#include "car/car.hpp"
#include "utils/logging.hpp"
#include <stdexcept>
#include <utility>

namespace car {

Car::Car(std::unique_ptr<engine::Engine> engine, std::ostream& out)
    : engine_(std::move(engine)),
      out_(out)
{
    if (!engine_) {
        throw std::invalid_argument("[Car] Engine must not be null");
    }
    LOG_INFO("[Car] Constructed with %s", engine_->type().c_str());
}

void Car::start_car() {
    out_ << "Car is starting with " << engine_->type() << "\n";
    engine_->start(out_);
}

void Car::stop_car() {
    out_ << "Car is stopping with " << engine_->type() << "\n";
    engine_->stop(out_);
}

std::unique_ptr<engine::Engine> Car::set_engine(std::unique_ptr<engine::Engine> engine) {
    if (!engine) {
        LOG_ERROR("[Car] Rejected null engine, keeping %s", engine_->type().c_str());
        throw std::invalid_argument("[Car] Replacement engine must not be null");
    }

    LOG_INFO("[Car] Swapping %s -> %s",
             engine_->type().c_str(), engine->type().c_str());

    std::unique_ptr<engine::Engine> previous = std::move(engine_);
    engine_ = std::move(engine);
    ++swap_count_;

    out_ << "Engine replaced with: " << engine_->type() << "\n";
    return previous;
}

std::unique_ptr<engine::Engine> Car::release_engine() && {
    LOG_INFO("[Car] Releasing %s", engine_->type().c_str());
    return std::move(engine_);
}

} // namespace car
