#pragma once

#include <string>
#include <vector>

namespace screencap {

// Inference devices known to the detectors. "CPU" is always present,
// "CUDA" only when LibTorch sees at least one CUDA device.
class DeviceManager {
public:
    static DeviceManager& instance();

    std::vector<std::string> get_available_devices() const;
    bool is_device_available(const std::string& device) const;
    int get_cuda_device_count() const { return cuda_device_count_; }

    // Best device when use_gpu is set, otherwise "CPU"
    std::string select_device(bool use_gpu) const;

private:
    DeviceManager();

    void initialize_devices();

    std::vector<std::string> available_devices_;
    int cuda_device_count_ = 0;
};

} // namespace screencap
