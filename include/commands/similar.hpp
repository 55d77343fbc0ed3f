#pragma once

int cmd_similar(int argc, char** argv);
