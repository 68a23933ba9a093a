#include "jobforge/action/handler.hpp"

#include "jobforge/util/log.hpp"

#include <ranges>

namespace jobforge {

auto ActionRegistry::register_handler(std::string id,
                                      std::shared_ptr<IActionHandler> handler)
    -> void {
  log::debug("Registered action handler '{}'", id);
  handlers_.insert_or_assign(std::move(id), std::move(handler));
}

auto ActionRegistry::register_function(std::string id, FunctionHandler::Fn fn,
                                       HandlerCapabilities caps) -> void {
  register_handler(std::move(id),
                   std::make_shared<FunctionHandler>(std::move(fn), caps));
}

auto ActionRegistry::find(std::string_view id) const -> IActionHandler * {
  auto it = handlers_.find(id);
  return it != handlers_.end() ? it->second.get() : nullptr;
}

auto ActionRegistry::ids() const -> std::vector<std::string> {
  return handlers_ | std::views::keys | std::ranges::to<std::vector>();
}

auto ActionRegistry::capabilities_of(const ActionTree &tree) const
    -> HandlerCapabilities {
  HandlerCapabilities out{.has_progress = tree.size() > 1};
  for (ActionIndex i = 0; i < tree.size(); ++i) {
    const auto *handler = find(tree.action(i).id.value());
    if (handler == nullptr) {
      continue;
    }
    const auto caps = handler->capabilities();
    out.can_stop = out.can_stop && caps.can_stop;
    out.can_pause = out.can_pause && caps.can_pause;
    out.has_progress = out.has_progress || caps.has_progress;
  }
  return out;
}

} // namespace jobforge
