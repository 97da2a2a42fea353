export module RHI;

export import :Buffer;
export import :Context;
export import :Device;
export import :MirroredBuffer;
export import :Types;
