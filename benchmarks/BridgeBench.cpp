
#include <iostream>

#include <NGIN/Benchmark.hpp>
#include <ObjBridge/ObjBridge.hpp>

using namespace NGIN;

namespace BenchDemo
{
  using ObjBridge::ObjectId;
  using ObjBridge::SelectorId;

  std::int64_t Add(ObjectId self, SelectorId, std::int64_t v)
  {
    return *ObjBridge::LocalRuntime::Of(self).Ivar<std::int64_t>(self, "_n") += v;
  }
  double Scale(ObjectId, SelectorId, double v) { return v * 2.0; }
}

int main()
{
  using namespace ObjBridge;

  LocalRuntime runtime;
  auto defined = runtime.DefineClass("Accumulator")
                     .Ivar("_n", "q")
                     .Property("n", "Tq,N,V_n")
                     .InstanceMethod("add:", "q24@0:8q16", ToImp(&BenchDemo::Add))
                     .InstanceMethod("scale:", "d24@0:8d16", ToImp(&BenchDemo::Scale))
                     .Register();
  if (!defined)
  {
    std::cerr << defined.error().Describe() << "\n";
    return 1;
  }

  Bridge bridge{runtime};
  auto acc = bridge.ResolveClass("Accumulator").value().CallAs<ProxyHandle>("new").value();
  auto signature = DecodeMethodEncoding("q24@0:8q16", 1).value();

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    Any arg{std::int64_t{1}};
    ctx.start();
    std::int64_t last = 0;
    for (int i=0;i<10000;++i) {
      last = acc.Call("add:", &arg, 1).value().Cast<std::int64_t>();
    }
    ctx.doNotOptimize(last);
    ctx.stop(); }, "Call add:(q) resolved 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    Any arg{std::int64_t{1}};
    ctx.start();
    std::int64_t last = 0;
    for (int i=0;i<10000;++i) {
      last = acc.CallWithSignature("add:", signature, std::span<const Any>{&arg, 1}).value().Cast<std::int64_t>();
    }
    ctx.doNotOptimize(last);
    ctx.stop(); }, "CallWithSignature add:(q) 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    Any arg{3}; // int promoted into a double slot
    ctx.start();
    double sum = 0;
    for (int i=0;i<10000;++i) {
      sum += acc.Call("scale:", &arg, 1).value().Cast<double>();
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "Call scale:(conv int->double) 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    std::int64_t sum = 0;
    for (int i=0;i<10000;++i) {
      sum += acc.GetPropertyAs<std::int64_t>("n").value();
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "GetProperty n 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    std::int64_t sum = 0;
    for (int i=0;i<10000;++i) {
      sum += BenchDemo::Add(acc.Id(), nullptr, 1);
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "Direct add: 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    std::size_t decoded = 0;
    for (int i=0;i<10000;++i) {
      decoded += Decode("{CGRect=\"origin\"{CGPoint=\"x\"d\"y\"d}\"size\"{CGSize=\"width\"d\"height\"d}}").value().Size();
    }
    ctx.doNotOptimize(decoded);
    ctx.stop(); }, "Decode nested struct 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    bool ok = true;
    for (int i=0;i<10000;++i) {
      ok = bridge.Cache().ResolveMethod("Accumulator", "add:", false).has_value() && ok;
    }
    ctx.doNotOptimize(ok);
    ctx.stop(); }, "MetadataCache method hit 10k");

  auto results = Benchmark::RunAll<Milliseconds>();
  Benchmark::PrintSummaryTable(std::cout, results);
  return 0;
}
