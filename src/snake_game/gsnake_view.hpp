/**
 * @file gsnake_view.hpp
 * @brief C++-обвязка над C API отображения
 */

#pragma once

#include <stdexcept>
#include <string>

extern "C" {
#include "../gui/common/view.h"
}

#include "common/gsnake_config.hpp"

namespace gsnake {

/// Бэкенд отображения вернул ошибку.
class ViewError : public std::runtime_error {
 public:
  ViewError(const std::string& operation, ViewResult_t result);

  ViewResult_t result() const noexcept { return result_; }

 private:
  ViewResult_t result_;
};

const char* view_result_name(ViewResult_t result) noexcept;

/// @throws ViewError если result != VIEW_OK
void check_view(ViewResult_t result, const char* operation);

/**
 * @brief Параметры View из конфигурации.
 *
 * Строки палитры указывают в config — он должен жить дольше результата.
 */
ViewConfig_t make_view_config(const GameConfig& config, int width, int height);

}  // namespace gsnake
