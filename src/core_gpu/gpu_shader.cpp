#include "core_gpu/gpu_shader.h"
#include "core_gpu/gpu_core.h"
#include "core_gpu/gpu_types.h"
#include "core_util/logger.h"
#include <webgpu/webgpu.h>
#include <utility>

using namespace uicomp::util;

namespace uicomp {
namespace gpu {

GPUShader::GPUShader(const ShaderConfig& config)
    : label_(config.label) {
    auto& core = GPUCore::GetInstance();
    if (!core.IsInitialized()) {
        throw GPUException("Cannot create shader module before GPUCore is ready: " + label_);
    }

    WGPUShaderSourceWGSL wgsl_source = WGPU_SHADER_SOURCE_WGSL_INIT;
    wgsl_source.code = {config.code.data(), config.code.size()};

    WGPUShaderModuleDescriptor desc = WGPU_SHADER_MODULE_DESCRIPTOR_INIT;
    desc.nextInChain = &wgsl_source.chain;
    desc.label = {label_.data(), label_.size()};

    handle_ = wgpuDeviceCreateShaderModule(core.GetDevice(), &desc);
    if (!handle_) {
        throw GPUException("Failed to create shader module: " + label_);
    }

    LogInfo("GPUShader created: ", label_);
}

GPUShader::~GPUShader() {
    Release();
}

GPUShader::GPUShader(GPUShader&& other) noexcept
    : handle_(other.handle_), label_(std::move(other.label_)) {
    other.handle_ = nullptr;
}

GPUShader& GPUShader::operator=(GPUShader&& other) noexcept {
    if (this != &other) {
        Release();
        handle_ = other.handle_;
        label_ = std::move(other.label_);
        other.handle_ = nullptr;
    }
    return *this;
}

WGPUShaderModule GPUShader::GetHandle() const { return handle_; }
const std::string& GPUShader::GetLabel() const { return label_; }

void GPUShader::Release() {
    if (handle_) {
        wgpuShaderModuleRelease(handle_);
        handle_ = nullptr;
    }
}

}  // namespace gpu
}  // namespace uicomp
