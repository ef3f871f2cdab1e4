#pragma once

#include "nove/v1.hpp"
#include "service_context.hpp"

namespace nove::service {

class ContactService {
 public:
  explicit ContactService(ServiceContext ctx);

  // Stores the submission, then queues the operator notice and the auto-reply.
  nove::v1::StatusResponse Submit(const nove::v1::ContactForm& form);

  // Newest first.
  nove::v1::ContactList List();

 private:
  ServiceContext ctx_;
};

} // namespace nove::service
