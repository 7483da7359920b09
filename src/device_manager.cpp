#include "device_manager.hpp"
#include <torch/torch.h>
#include <algorithm>
#include <iostream>

namespace screencap {

DeviceManager& DeviceManager::instance() {
    static DeviceManager instance;
    return instance;
}

DeviceManager::DeviceManager() {
    initialize_devices();
}

void DeviceManager::initialize_devices() {
    // Always add CPU
    available_devices_.push_back("CPU");

    if (torch::cuda::is_available()) {
        cuda_device_count_ = static_cast<int>(torch::cuda::device_count());
        available_devices_.push_back("CUDA");
    }

    std::cout << "DeviceManager initialized with devices: ";
    for (size_t i = 0; i < available_devices_.size(); ++i) {
        std::cout << available_devices_[i];
        if (i < available_devices_.size() - 1) std::cout << ", ";
    }
    if (cuda_device_count_ > 0) {
        std::cout << " (" << cuda_device_count_ << " CUDA device"
                  << (cuda_device_count_ > 1 ? "s" : "") << ")";
    }
    std::cout << std::endl;
}

std::vector<std::string> DeviceManager::get_available_devices() const {
    return available_devices_;
}

bool DeviceManager::is_device_available(const std::string& device) const {
    return std::find(available_devices_.begin(), available_devices_.end(), device)
           != available_devices_.end();
}

std::string DeviceManager::select_device(bool use_gpu) const {
    if (use_gpu && is_device_available("CUDA")) {
        return "CUDA";
    }
    if (use_gpu) {
        std::cout << "CUDA not available, using CPU" << std::endl;
    }
    return "CPU";
}

} // namespace screencap
