#pragma once

/**
 * @file
 *
 * This header contains forward declarations for all major types in ximc for
 * easy use in headers.
 **/

namespace ximc {

class Callbacks;
class Client;
class ConfigFile;
class ContextLifecycle;
class EngineListener;
class EventDispatcher;
class ImdkitEngine;
class KeyEvent;
class PlacementCoordinator;
class PreeditInfo;
class ProtocolEngine;
class TextDecoder;
struct ContextAttributes;
struct PreeditFrame;
struct Settings;

} // end ns
