// VulkanContext.cpp

#include <lumen/VulkanContext.hpp>
#include <lumen/Logger.hpp>
#include <lumen/Window.hpp>
#include <array>
#include <cstring>
#include <optional>
#include <set>
#include <stdexcept>

VULKAN_HPP_DEFAULT_DISPATCH_LOADER_DYNAMIC_STORAGE

namespace lumen {

namespace {

#ifdef NDEBUG
constexpr bool ENABLE_VALIDATION = false;
#else
constexpr bool ENABLE_VALIDATION = true;
#endif

constexpr std::array VALIDATION_LAYERS = {
    "VK_LAYER_KHRONOS_validation"
};

vk::Bool32 debug_callback(
    vk::DebugUtilsMessageSeverityFlagBitsEXT severity,
    [[maybe_unused]] vk::DebugUtilsMessageTypeFlagsEXT type,
    const vk::DebugUtilsMessengerCallbackDataEXT* callback_data,
    [[maybe_unused]] void* user_data)
{
    auto& logger = Logger::instance();
    auto pattern = fmt::format("[Lumen]{:<32}[%^%5l%$] %v", "[VulkanDebug]");
    logger.set_pattern(pattern);
    switch (static_cast<VkDebugUtilsMessageSeverityFlagBitsEXT>(severity)) {
        case VK_DEBUG_UTILS_MESSAGE_SEVERITY_VERBOSE_BIT_EXT:
            logger.trace("{}", callback_data->pMessage);
            break;
        case VK_DEBUG_UTILS_MESSAGE_SEVERITY_INFO_BIT_EXT:
            logger.debug("{}", callback_data->pMessage);
            break;
        case VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT:
            logger.warn("{}", callback_data->pMessage);
            break;
        case VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT:
            logger.error("{}", callback_data->pMessage);
            break;
        default:
            logger.info("{}", callback_data->pMessage);
            break;
    }

    return vk::False;
}

bool check_validation_layer_support()
{
    auto available_res = vk::enumerateInstanceLayerProperties();
    if (available_res.result != vk::Result::eSuccess) {
        Logger::instance().warn("Could not query InstanceLayerProperties {}", vk::to_string(available_res.result));
        return false;
    }
    for (const char* layer_name : VALIDATION_LAYERS) {
        bool found = false;
        for (const auto& layer : available_res.value) {
            if (std::strcmp(layer_name, layer.layerName) == 0) {
                found = true;
                break;
            }
        }
        if (!found) {
            Logger::instance().warn("Validation layer {} not available", layer_name);
            return false;
        }
    }
    return true;
}

vk::DebugUtilsMessengerCreateInfoEXT make_debug_messenger_create_info()
{
    return vk::DebugUtilsMessengerCreateInfoEXT()
        .setMessageSeverity(
            vk::DebugUtilsMessageSeverityFlagBitsEXT::eWarning |
            vk::DebugUtilsMessageSeverityFlagBitsEXT::eError)
        .setMessageType(
            vk::DebugUtilsMessageTypeFlagBitsEXT::eGeneral |
            vk::DebugUtilsMessageTypeFlagBitsEXT::eValidation |
            vk::DebugUtilsMessageTypeFlagBitsEXT::ePerformance)
        .setPfnUserCallback(debug_callback);
}

vk::Instance create_instance(std::string_view title)
{
    Window::ensure_glfw_initialized();

    static vk::detail::DynamicLoader dl;
    auto vkGetInstanceProcAddr = dl.getProcAddress<PFN_vkGetInstanceProcAddr>("vkGetInstanceProcAddr");
    VULKAN_HPP_DEFAULT_DISPATCHER.init(vkGetInstanceProcAddr);

    std::string app_name{title};
    auto app_info = vk::ApplicationInfo()
        .setPApplicationName(app_name.c_str())
        .setApplicationVersion(VK_MAKE_VERSION(1, 0, 0))
        .setPEngineName("Lumen")
        .setEngineVersion(VK_MAKE_VERSION(1, 0, 0))
        .setApiVersion(VK_API_VERSION_1_3);

    uint32_t glfw_extension_count = 0;
    const char** glfw_extensions = glfwGetRequiredInstanceExtensions(&glfw_extension_count);
    if (!glfw_extensions) {
        throw std::runtime_error{"Failed to query required instance extensions"};
    }

    std::vector<const char*> extensions(glfw_extensions, glfw_extensions + glfw_extension_count);

    if constexpr (ENABLE_VALIDATION) {
        extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
    }
    extensions.push_back(VK_KHR_SURFACE_EXTENSION_NAME);

    Logger::instance().debug("Instance extensions:");
    for (const auto* ext : extensions) {
        Logger::instance().debug("  {}", ext);
    }

    auto create_info = vk::InstanceCreateInfo()
        .setPApplicationInfo(&app_info)
        .setPEnabledExtensionNames(extensions);

    vk::DebugUtilsMessengerCreateInfoEXT debug_create_info;
    if constexpr (ENABLE_VALIDATION) {
        if (check_validation_layer_support()) {
            create_info.setPEnabledLayerNames(VALIDATION_LAYERS);

            debug_create_info = make_debug_messenger_create_info();
            create_info.setPNext(&debug_create_info);

            Logger::instance().info("Validation layers enabled");
        }
    }

    auto instance_res = vk::createInstance(create_info);
    if (instance_res.result != vk::Result::eSuccess) {
        throw std::runtime_error{std::format("Failed to create instance {}", vk::to_string(instance_res.result))};
    }
    auto instance = instance_res.value;
    VULKAN_HPP_DEFAULT_DISPATCHER.init(instance);
    Logger::instance().debug("Created Vulkan instance");
    return instance;
}

vk::DebugUtilsMessengerEXT create_debug_messenger(vk::Instance instance)
{
    if constexpr (!ENABLE_VALIDATION) {
        return nullptr;
    }

    auto create_info = make_debug_messenger_create_info();

    auto debug_msngr_res = instance.createDebugUtilsMessengerEXT(create_info, nullptr);
    if (debug_msngr_res.result != vk::Result::eSuccess) {
        Logger::instance().warn("Failed to create debug messenger {}", vk::to_string(debug_msngr_res.result));
        return nullptr;
    }
    Logger::instance().debug("Created debug messenger");
    return debug_msngr_res.value;
}

void destroy_debug_messenger(vk::Instance instance, vk::DebugUtilsMessengerEXT messenger)
{
    if (!messenger) return;

    instance.destroyDebugUtilsMessengerEXT(messenger, nullptr);
    Logger::instance().trace("Destroyed debug messenger");
}

vk::PhysicalDevice select_physical_device(vk::Instance instance)
{
    auto devices_res = instance.enumeratePhysicalDevices();
    if (devices_res.result != vk::Result::eSuccess) {
        throw std::runtime_error{std::format("Failed to enumerate physical devices {}", vk::to_string(devices_res.result))};
    }
    auto devices = std::move(devices_res.value);

    for (const auto& dev : devices) {
        auto props = dev.getProperties();
        if (props.deviceType == vk::PhysicalDeviceType::eDiscreteGpu) {
            Logger::instance().info("Selected discrete GPU: {}", props.deviceName.data());
            return dev;
        }
    }

    for (const auto& dev : devices) {
        auto props = dev.getProperties();
        if (props.deviceType == vk::PhysicalDeviceType::eIntegratedGpu) {
            Logger::instance().info("Selected integrated GPU: {}", props.deviceName.data());
            return dev;
        }
    }

    throw std::runtime_error{"No suitable physical device found"};
}

QueueFamilyInfo find_queue_families(vk::Instance instance, vk::PhysicalDevice physical_device)
{
    auto queue_families = physical_device.getQueueFamilyProperties();

    auto result = select_queue_families(queue_families, [&](uint32_t index) {
        return glfwGetPhysicalDevicePresentationSupport(
            static_cast<VkInstance>(instance),
            static_cast<VkPhysicalDevice>(physical_device),
            index) == GLFW_TRUE;
    });
    if (!result) {
        throw std::runtime_error{result.error()};
    }

    Logger::instance().debug("Queue families - main: {}, present: {}, transfer: {}",
                             result->main, result->present, result->transfer);
    return *result;
}

vk::Device create_logical_device(vk::PhysicalDevice physical_device, const QueueFamilyInfo& families)
{
    std::vector<vk::DeviceQueueCreateInfo> queue_create_infos;
    std::set<uint32_t> unique_families = {families.main, families.present, families.transfer};

    float queue_priority = 1.0f;
    for (uint32_t family : unique_families) {
        auto queue_create_info = vk::DeviceQueueCreateInfo()
            .setQueueFamilyIndex(family)
            .setQueueCount(1)
            .setPQueuePriorities(&queue_priority);
        queue_create_infos.push_back(queue_create_info);
    }

    std::vector<const char*> extensions = {VK_KHR_SWAPCHAIN_EXTENSION_NAME};

    // Vulkan 1.3 features
    vk::PhysicalDeviceVulkan13Features vulkan13_features{};
    vulkan13_features.dynamicRendering = VK_TRUE;
    vulkan13_features.synchronization2 = VK_TRUE;

    vk::PhysicalDeviceFeatures2 features2{};
    features2.pNext = &vulkan13_features;

    auto create_info = vk::DeviceCreateInfo()
        .setQueueCreateInfos(queue_create_infos)
        .setPEnabledExtensionNames(extensions)
        .setPNext(&features2);

    auto device_res = physical_device.createDevice(create_info);
    if (device_res.result != vk::Result::eSuccess) {
        throw std::runtime_error{std::format("Failed to create device {}", vk::to_string(device_res.result))};
    }
    Logger::instance().debug("Created logical device");
    return device_res.value;
}

vk::CommandPool create_main_pool(vk::Device device, uint32_t family)
{
    auto pool_info = vk::CommandPoolCreateInfo()
        .setQueueFamilyIndex(family)
        .setFlags(vk::CommandPoolCreateFlagBits::eResetCommandBuffer);

    auto pool_res = device.createCommandPool(pool_info);
    if (pool_res.result != vk::Result::eSuccess) {
        throw std::runtime_error{std::format("Failed to create command pool {}", vk::to_string(pool_res.result))};
    }
    Logger::instance().debug("Created main command pool");
    return pool_res.value;
}

} // anonymous namespace

std::expected<QueueFamilyInfo, std::string> select_queue_families(
    std::span<const vk::QueueFamilyProperties> families,
    const std::function<bool(uint32_t)>& supports_present)
{
    std::optional<uint32_t> main;
    std::optional<uint32_t> present;
    std::optional<uint32_t> transfer;

    for (uint32_t i = 0; i < families.size(); i++) {
        const auto flags = families[i].queueFlags;

        if (!main && (flags & vk::QueueFlagBits::eGraphics)) {
            main = i;
            if (supports_present(i)) {
                present = i;
            }
        }

        if (!present && supports_present(i)) {
            present = i;
        }

        if (!transfer &&
            !(flags & vk::QueueFlagBits::eGraphics) &&
            !(flags & vk::QueueFlagBits::eCompute) &&
            (flags & vk::QueueFlagBits::eTransfer)) {
            transfer = i;
        }
    }

    if (!main || !present) {
        return std::unexpected("Missing required queue family support on targeted GPU");
    }

    // Shared with main on GPUs lacking a dedicated transfer family
    if (!transfer) {
        transfer = main;
        Logger::instance().debug("No exclusive transfer queue available, defaulting to main queue");
    }

    return QueueFamilyInfo{*main, *present, *transfer};
}

VulkanContext::VulkanContext(std::string_view title)
    : m_instance(create_instance(title))
    , m_debug_messenger(create_debug_messenger(m_instance))
    , m_physical_device(select_physical_device(m_instance))
    , m_queue_families(find_queue_families(m_instance, m_physical_device))
    , m_device(create_logical_device(m_physical_device, m_queue_families))
{
    VULKAN_HPP_DEFAULT_DISPATCHER.init(m_device);

    m_queues = Queues{
        .main = m_device.getQueue(m_queue_families.main, 0),
        .present = m_device.getQueue(m_queue_families.present, 0),
        .transfer = m_device.getQueue(m_queue_families.transfer, 0),
    };
    m_main_pool = create_main_pool(m_device, m_queue_families.main);

    Logger::instance().info("VulkanContext VK_HEADER_VERSION: {}", VK_HEADER_VERSION);
    Logger::instance().info("VulkanContext initialized");
}

VulkanContext::~VulkanContext()
{
    if (m_main_pool) {
        m_device.destroyCommandPool(m_main_pool);
        Logger::instance().trace("Destroyed main command pool");
    }

    if (m_device) {
        m_device.destroy();
        Logger::instance().trace("Destroyed logical device");
    }

    destroy_debug_messenger(m_instance, m_debug_messenger);

    if (m_instance) {
        m_instance.destroy();
        Logger::instance().trace("Destroyed instance");
    }
}

std::expected<vk::Semaphore, std::string> VulkanContext::create_semaphore()
{
    auto semaphore_res = m_device.createSemaphore(vk::SemaphoreCreateInfo());
    LUMEN_CHECK_VK_RESULT(semaphore_res, "Could not create semaphore {}");
    return semaphore_res.value;
}

std::expected<vk::Fence, std::string> VulkanContext::create_fence(bool signaled)
{
    auto fence_info = vk::FenceCreateInfo();
    if (signaled) {
        fence_info.setFlags(vk::FenceCreateFlagBits::eSignaled);
    }

    auto fence_res = m_device.createFence(fence_info);
    LUMEN_CHECK_VK_RESULT(fence_res, "Could not create fence {}");
    return fence_res.value;
}

void VulkanContext::destroy_semaphore(vk::Semaphore semaphore)
{
    m_device.destroySemaphore(semaphore);
}

void VulkanContext::destroy_fence(vk::Fence fence)
{
    m_device.destroyFence(fence);
}

vk::Result VulkanContext::wait_for_fences(std::span<const vk::Fence> fences, uint64_t timeout)
{
    return m_device.waitForFences(
        vk::ArrayProxy<const vk::Fence>(static_cast<uint32_t>(fences.size()), fences.data()),
        vk::True,
        timeout);
}

vk::Result VulkanContext::reset_fence(vk::Fence fence)
{
    return m_device.resetFences(fence);
}

std::expected<std::vector<vk::CommandBuffer>, std::string> VulkanContext::allocate_command_buffers(
    uint32_t count,
    vk::CommandBufferLevel level)
{
    auto alloc_info = vk::CommandBufferAllocateInfo()
        .setCommandPool(m_main_pool)
        .setLevel(level)
        .setCommandBufferCount(count);

    auto buffers_res = m_device.allocateCommandBuffers(alloc_info);
    LUMEN_CHECK_VK_RESULT(buffers_res, "Could not allocate command buffers {}");
    return std::move(buffers_res.value);
}

void VulkanContext::free_command_buffers(std::span<const vk::CommandBuffer> command_buffers)
{
    if (command_buffers.empty()) return;

    m_device.freeCommandBuffers(
        m_main_pool,
        vk::ArrayProxy<const vk::CommandBuffer>(static_cast<uint32_t>(command_buffers.size()), command_buffers.data()));
}

vk::Result VulkanContext::submit(std::span<const vk::SubmitInfo> submits, vk::Fence fence)
{
    return m_queues.main.submit(
        vk::ArrayProxy<const vk::SubmitInfo>(static_cast<uint32_t>(submits.size()), submits.data()),
        fence);
}

vk::Result VulkanContext::wait_idle()
{
    return m_device.waitIdle();
}

vk::Result VulkanContext::begin_command_buffer(vk::CommandBuffer cmd, const vk::CommandBufferBeginInfo& begin_info)
{
    return cmd.begin(begin_info);
}

vk::Result VulkanContext::end_command_buffer(vk::CommandBuffer cmd)
{
    return cmd.end();
}

void VulkanContext::cmd_pipeline_barrier2(vk::CommandBuffer cmd, const vk::DependencyInfo& dependency_info)
{
    cmd.pipelineBarrier2(dependency_info);
}

void VulkanContext::cmd_begin_rendering(vk::CommandBuffer cmd, const vk::RenderingInfo& rendering_info)
{
    cmd.beginRendering(rendering_info);
}

void VulkanContext::cmd_end_rendering(vk::CommandBuffer cmd)
{
    cmd.endRendering();
}

void VulkanContext::cmd_bind_pipeline(vk::CommandBuffer cmd, vk::PipelineBindPoint bind_point, vk::Pipeline pipeline)
{
    cmd.bindPipeline(bind_point, pipeline);
}

void VulkanContext::cmd_draw(
    vk::CommandBuffer cmd,
    uint32_t vertex_count,
    uint32_t instance_count,
    uint32_t first_vertex,
    uint32_t first_instance)
{
    cmd.draw(vertex_count, instance_count, first_vertex, first_instance);
}

void VulkanContext::cmd_set_viewport(vk::CommandBuffer cmd, const vk::Viewport& viewport)
{
    cmd.setViewport(0, viewport);
}

void VulkanContext::cmd_set_scissor(vk::CommandBuffer cmd, const vk::Rect2D& scissor)
{
    cmd.setScissor(0, scissor);
}

} // namespace lumen
