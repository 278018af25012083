// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "printer_backend.h"

#include "printer_backend_http.h"
#include "printer_backend_mock.h"

#include <spdlog/spdlog.h>

namespace printdeck {

std::unique_ptr<PrinterBackend> PrinterBackend::create(const PrinterDetails& details,
                                                       hv::EventLoopPtr loop) {
    PrinterModel model = detect_printer_model(details.model);

    switch (model) {
    case PrinterModel::ADVENTURER_5M:
    case PrinterModel::ADVENTURER_5M_PRO:
    case PrinterModel::AD5X:
        spdlog::debug("[PrinterBackend] Creating HTTP backend for {} ({})", details.name,
                      printer_model_display_name(model));
        return std::make_unique<HttpPrinterBackend>(details, model, std::move(loop));

    case PrinterModel::MOCK:
        spdlog::debug("[PrinterBackend] Creating mock backend for {}", details.name);
        return std::make_unique<PrinterBackendMock>(details, model);

    case PrinterModel::GENERIC_LEGACY:
        spdlog::error("[PrinterBackend] {} ('{}') uses the legacy TCP protocol, which is not "
                      "supported",
                      details.name, details.model);
        return nullptr;
    }

    spdlog::error("[PrinterBackend] Unknown model for {}", details.name);
    return nullptr;
}

} // namespace printdeck
