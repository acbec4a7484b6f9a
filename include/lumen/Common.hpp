#ifndef LUMEN_COMMON_HPP
#define LUMEN_COMMON_HPP
#include <vulkan/vulkan.hpp>
#include <GLFW/glfw3.h>
#include <expected>
#include <format>
#include <string>

#define LUMEN_CHECK_VK_RESULT(res, msg) \
if (res.result != vk::Result::eSuccess) \
{ \
	return std::unexpected(std::format(msg, vk::to_string(res.result))); \
} \

#define LUMEN_CHECK_VK_RESULT_VOID(res, msg) \
if (res != vk::Result::eSuccess) \
{ \
	return std::unexpected(std::format(msg, vk::to_string(res))); \
} \

#endif // LUMEN_COMMON_HPP
