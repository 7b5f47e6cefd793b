#include <ObjBridge/ObjBridge.hpp>

#include <iostream>
#include <string>

namespace Demo
{
  using namespace ObjBridge;

  double Celsius(ObjectId self, SelectorId) { return *LocalRuntime::Of(self).Ivar<double>(self, "_celsius"); }
  void SetCelsius(ObjectId self, SelectorId, double value) { *LocalRuntime::Of(self).Ivar<double>(self, "_celsius") = value; }
  double Fahrenheit(ObjectId self, SelectorId) { return Celsius(self, nullptr) * 9.0 / 5.0 + 32.0; }
  const char *Unit(ObjectId, SelectorId) { return "degC"; }
}

int main()
{
  using namespace ObjBridge;

  // A foreign class described purely by runtime metadata.
  LocalRuntime runtime;
  auto defined = runtime.DefineClass("Thermometer")
                     .Ivar("_celsius", "d")
                     .Property("celsius", "Td,N,V_celsius")
                     .InstanceMethod("celsius", "d16@0:8", ToImp(&Demo::Celsius))
                     .InstanceMethod("setCelsius:", "v24@0:8d16", ToImp(&Demo::SetCelsius))
                     .InstanceMethod("fahrenheit", "d16@0:8", ToImp(&Demo::Fahrenheit))
                     .InstanceMethod("unit", "r*16@0:8", ToImp(&Demo::Unit))
                     .Register();
  if (!defined)
  {
    std::cerr << defined.error().Describe() << "\n";
    return 1;
  }

  Bridge bridge{runtime};
  auto cls = bridge.ResolveClass("Thermometer");
  if (!cls)
  {
    std::cerr << cls.error().Describe() << "\n";
    return 1;
  }

  // "new" returns an owned reference; the handle releases it on scope exit.
  auto thermometer = cls->CallAs<ProxyHandle>("new").value();
  if (auto set = thermometer.SetProperty("celsius", Any{21.5}); !set)
    std::cerr << set.error().Describe() << "\n";

  std::cout << "Class: " << thermometer.ClassName() << "\n";
  std::cout << "celsius: " << thermometer.GetPropertyAs<double>("celsius").value() << "\n";
  std::cout << "fahrenheit: " << thermometer.CallAs<double>("fahrenheit").value() << "\n";
  std::cout << "unit: " << thermometer.GetAttribute("unit")->Cast<std::string>() << "\n";
  std::cout << "responds to fahrenheit: " << std::boolalpha << thermometer.RespondsTo("fahrenheit") << "\n";

  auto missing = thermometer.Call("kelvin");
  if (!missing)
    std::cout << "kelvin: " << missing.error().Describe() << "\n";

  return 0;
}
