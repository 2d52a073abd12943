#include "folio/store/order_state_machine.hpp"

namespace folio {

bool OrderStateMachine::transitionStatus(domain::OrderStatus current,
                                         domain::OrderStatus next) {
  using S = domain::OrderStatus;

  switch (current) {
    case S::Pending:
      return next == S::Executed ||
             next == S::Failed;

    case S::Executed:
    case S::Failed:
      return false;
  }

  return false;
}

bool OrderStateMachine::isTerminal(domain::OrderStatus status) {
  using S = domain::OrderStatus;
  return status == S::Executed ||
         status == S::Failed;
}

}  // namespace folio
