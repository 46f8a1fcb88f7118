#ifndef CUMULUS_CORE_ERRORS_HXX
#define CUMULUS_CORE_ERRORS_HXX

#include <string>
#include <stdexcept>
#include <exception>

namespace cumulus
{
  // adopt mode request is missing one of its required id lists
  class MissingField : public std::runtime_error
  {
    public:
      explicit MissingField(std::string field);
      const std::string & field() const;

    private:
      std::string field_;
  };

  // construct mode zone count outside of [1,3]
  class InvalidZoneCount : public std::runtime_error
  {
    public:
      explicit InvalidZoneCount(long count);
      long count() const;

    private:
      long count_;
  };

  // a zone index the address scheme cannot place without overlap
  class AllocationExhausted : public std::runtime_error
  {
    public:
      explicit AllocationExhausted(long zone);
      long zone() const;

    private:
      long zone_;
  };

  /*
   * the provisioning collaborator failed to create a plan node. the provider's
   * exception is kept so callers can get at the underlying cause unchanged
   */
  class ProvisioningFailure : public std::runtime_error
  {
    public:
      ProvisioningFailure(std::string kind, std::string node, 
                          std::exception_ptr cause);

      const std::string & kind() const;
      const std::string & node() const;
      std::exception_ptr cause() const;
      [[noreturn]] void rethrowCause() const;

    private:
      std::string kind_, node_;
      std::exception_ptr cause_;
  };

  std::string describe(std::exception_ptr);
}

#endif
