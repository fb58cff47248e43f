#include <core/generator.hpp>

#include <boost/random/random_device.hpp>

namespace uuid4::core {

auto generate() -> identifier
{
  static thread_local boost::random::random_device device;
  return generate(device);
}

}// namespace uuid4::core
