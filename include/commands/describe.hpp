#pragma once

int cmd_describe(int argc, char** argv);
