#pragma once

#include <ObjBridge/Export.hpp>
#include <ObjBridge/Types.hpp>
#include <ObjBridge/Encoding.hpp>
#include <ObjBridge/Runtime.hpp>
#include <ObjBridge/LocalRuntime.hpp>
#include <ObjBridge/Ownership.hpp>
#include <ObjBridge/MetadataCache.hpp>
#include <ObjBridge/SignatureResolver.hpp>
#include <ObjBridge/Marshaller.hpp>
#include <ObjBridge/Invocation.hpp>
#include <ObjBridge/Proxy.hpp>
#include <ObjBridge/Bridge.hpp>
#include <ObjBridge/Log.hpp>
